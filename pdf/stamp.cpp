/* File: stamp.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#include "stamp.hpp"

#include <qpdf/QPDFPageDocumentHelper.hh>
#include <stdexcept>

#include "font_metrics.hpp"
#include "pdf_utils.hpp"

namespace pdfasm::pdf {

namespace {

QPDFObjectHandle MakeFontDict(QPDF &pdf, StandardFont font) {
  QPDFObjectHandle dict = QPDFObjectHandle::newDictionary();
  dict.replaceKey(kTagType, QPDFObjectHandle::newName(kTagFont));
  dict.replaceKey(kTagSubType, QPDFObjectHandle::newName(kTagType1));
  dict.replaceKey(kTagBaseFont, QPDFObjectHandle::newName(BaseFontName(font)));
  dict.replaceKey(kTagEncoding,
                  QPDFObjectHandle::newName(kTagWinAnsiEncoding));
  return pdf.makeIndirectObject(dict);
}

}  // namespace

Stamp::Stamp(const BBox &page_box, const ContentStreamBuilder &content)
    : qpdf_(std::make_unique<QPDF>()),
      size_(page_box),
      content_(content.Str()),
      painted_area_(content.PaintedArea()) {
  if (size_.Width() <= 0 || size_.Height() <= 0) {
    throw std::runtime_error(std::string(kErrPageSize) + " " +
                             size_.ToString());
  }
  qpdf_->emptyPDF();
  qpdf_->setImmediateCopyFrom(true);
  QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
  for (const StandardFont font : content.UsedFonts()) {
    fonts.replaceKey(FontResourceName(font), MakeFontDict(*qpdf_, font));
  }
  QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
  resources.replaceKey(kTagProcSet,
                       QPDFObjectHandle::parse("[/PDF /Text]"));
  resources.replaceKey(kTagFont, fonts);

  QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
  page.replaceKey(kTagType, QPDFObjectHandle::newName(kTagPage));
  page.replaceKey(kTagMediaBox,
                  QPDFObjectHandle::newArray(QPDFObjectHandle::Rectangle(
                    size_.left_bottom.x, size_.left_bottom.y,
                    size_.right_top.x, size_.right_top.y)));
  page.replaceKey(kTagContents, qpdf_->newStream(content_));
  page.replaceKey(kTagResources, resources);
  QPDFPageDocumentHelper(*qpdf_).addPage(
    QPDFPageObjectHelper(qpdf_->makeIndirectObject(page)), false);
}

QPDFPageObjectHelper Stamp::Page() const {
  const auto &pages = qpdf_->getAllPages();
  if (pages.size() != 1) {
    throw std::logic_error("[Stamp::Page] stamp must have exactly one page");
  }
  return QPDFPageObjectHelper(pages[0]);
}

void Stamp::OverlayOnto(QPDFPageObjectHelper &target) const {
  const std::string func_name = "[Stamp::OverlayOnto] ";
  QPDFObjectHandle target_obj = target.getObjectHandle();
  QPDF *target_pdf = target_obj.getOwningQPDF();
  if (target_pdf == nullptr || target_pdf == qpdf_.get()) {
    throw std::runtime_error(func_name + "target page has no owner document");
  }
  // a page without a usable box is drawn at the origin, like the Letter
  // sized stamp it gets
  const XYReal offsets = CropBoxOffsetsXY(target).value_or(XYReal{0, 0});
  // copy the stamp as a form XObject into the target document
  QPDFObjectHandle form = target_pdf->copyForeignObject(
    Page().getFormXObjectForPage());

  // resources shared between pages are copied, the other pages stay intact
  QPDFObjectHandle resources = target.getAttribute(kTagResources, true);
  if (!resources.isDictionary()) {
    resources = QPDFObjectHandle::newDictionary();
    target_obj.replaceKey(kTagResources, resources);
  } else if (resources.isIndirect()) {
    resources = resources.shallowCopy();
    target_obj.replaceKey(kTagResources, resources);
  }
  resources.mergeResources(QPDFObjectHandle::parse("<< /XObject << >> >>"));
  QPDFObjectHandle xobjects = resources.getKey(kTagXObject);
  if (xobjects.isIndirect()) {
    xobjects = xobjects.shallowCopy();
    resources.replaceKey(kTagXObject, xobjects);
  }
  int min_suffix = 1;
  const std::string name =
    resources.getUniqueResourceName(kResStampPrefix, min_suffix);
  xobjects.replaceKey(name, form);

  // isolate the original content, then draw the stamp
  const Matrix placement = Matrix::Translate(offsets.x, offsets.y);
  target.addPageContents(target_pdf->newStream("q\n"), true);
  target.addPageContents(
    target_pdf->newStream("\nQ\nq\n" + placement.toString() + " cm\n" + name +
                          " Do\nQ\n"),
    false);
}

}  // namespace pdfasm::pdf
