/* File: overlay_renderer.cpp
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

#include "overlay_renderer.hpp"

#include "content_stream.hpp"
#include "footer_band.hpp"

namespace pdfasm::pdf {

Stamp OverlayRenderer::RenderFooter(const FooterSpec &spec) const {
  return RenderFooter(spec, BBox::Letter());
}

Stamp OverlayRenderer::RenderFooter(const FooterSpec &spec,
                                    const BBox &page_size) const {
  ContentStreamBuilder builder;
  FooterBand(page_size).Paint(builder, spec);
  return Stamp(page_size, builder);
}

}  // namespace pdfasm::pdf
