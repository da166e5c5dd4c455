/* File: cover_renderer.cpp
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

#include "cover_renderer.hpp"

#include "content_stream.hpp"
#include "font_metrics.hpp"
#include "footer_band.hpp"
#include "pdf_defs.hpp"
#include "pdf_utils.hpp"

namespace pdfasm::pdf {

Stamp CoverRenderer::RenderCover(const std::string &title,
                                 const FooterSpec &spec) const {
  const BBox page_box = BBox::Letter();
  ContentStreamBuilder builder;
  const std::string text = Utf8ToWinAnsi(title);
  if (!text.empty()) {
    const double width =
      StringWidth(text, StandardFont::kHelveticaBold, kCoverTitleFontSize);
    builder.SaveState();
    builder.FillColor(RGBColor{0, 0, 0});
    builder.Text(StandardFont::kHelveticaBold, kCoverTitleFontSize,
                 {(page_box.Width() - width) / 2, page_box.Height() / 2},
                 text);
    builder.RestoreState();
  }
  FooterBand(page_box).Paint(builder, spec);
  return Stamp(page_box, builder);
}

}  // namespace pdfasm::pdf
