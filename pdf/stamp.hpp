/* File: stamp.hpp
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

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "content_stream.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfasm::pdf {

/**
 * @brief A generated single page document (a footer or a cover)
 * @details owns its own QPDF, objects are copied into the target document
 * immediately, so the stamp can be destroyed right after it was used
 */
class Stamp {
public:
  /**
   * @brief Build a one-page pdf
   * @param page_box the MediaBox [0,0,width,height]
   * @param content painted content, the fonts it uses get resources
   * @throws std::runtime_error on qpdf failure
   */
  Stamp(const BBox &page_box, const ContentStreamBuilder &content);

  Stamp(const Stamp &) = delete;
  Stamp &operator=(const Stamp &) = delete;
  Stamp(Stamp &&) noexcept = default;
  Stamp &operator=(Stamp &&) noexcept = default;
  ~Stamp() = default;

  /// @brief the only page of the stamp
  [[nodiscard]] QPDFPageObjectHelper Page() const;

  [[nodiscard]] const BBox &Size() const noexcept { return size_; }

  /// @brief raw (unfiltered) content stream of the page
  [[nodiscard]] const std::string &Content() const noexcept {
    return content_;
  }

  /// @brief the area touched by the painting operators
  [[nodiscard]] const std::optional<BBox> &PaintedArea() const noexcept {
    return painted_area_;
  }

  /**
   * @brief Draw the stamp on top of the page
   * @details the page content is wrapped into q...Q, the stamp is placed as
   * a form XObject at the crop box origin of the target page, or at (0,0)
   * if the page has no usable box
   * @param target page in any QPDF except the stamp's one
   * @throws std::runtime_error
   */
  void OverlayOnto(QPDFPageObjectHelper &target) const;

private:
  std::unique_ptr<QPDF> qpdf_;
  BBox size_;
  std::string content_;
  std::optional<BBox> painted_area_;
};

}  // namespace pdfasm::pdf
