#pragma once

#include "pdf_defs.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <qpdf/QPDFObjectHandle.hh>
#include <string>
#include <utility>

namespace pdfasm::pdf {

struct XYReal {
  double x = 0;
  double y = 0;

  [[nodiscard]] std::string ToString() const;
};

struct BBox {
  XYReal left_bottom;
  XYReal right_top;

  [[nodiscard]] double Width() const noexcept {
    return right_top.x - left_bottom.x;
  }

  [[nodiscard]] double Height() const noexcept {
    return right_top.y - left_bottom.y;
  }

  [[nodiscard]] std::string ToString() const;

  /// @brief [0 0 612 792]
  static BBox Letter() noexcept {
    return BBox{{0, 0}, {kLetterWidth, kLetterHeight}};
  }
};

/*
Transformation matrix in pdf
[a b 0]
[c d 0]
[e f 1]
*/

struct Matrix {
  double a = 1;
  double b = 0;
  double c = 0;
  double d = 1;
  double e = 0;
  double f = 0;

  [[nodiscard]] std::string toString() const;

  static Matrix Translate(double x_offset, double y_offset) noexcept {
    Matrix res;
    res.e = x_offset;
    res.f = y_offset;
    return res;
  }
};

struct RGBColor {
  double red = 0;
  double green = 0;
  double blue = 0;

  [[nodiscard]] std::string ToString() const;
};

/**
 * @brief Parameters of one footer: "Page N of Total" and the report title
 * @details 1 <= page_number <= total_pages
 */
class FooterSpec {
 public:
  /**
   * @throws std::invalid_argument if page_number is out of [1,total_pages]
   */
  FooterSpec(size_t page_number, size_t total_pages,
             std::string report_title = {});

  [[nodiscard]] size_t PageNumber() const noexcept { return page_number_; }
  [[nodiscard]] size_t TotalPages() const noexcept { return total_pages_; }
  [[nodiscard]] const std::string &ReportTitle() const noexcept {
    return report_title_;
  }

  /// @brief "Page {page_number} of {total_pages}"
  [[nodiscard]] std::string PageText() const;

 private:
  size_t page_number_;
  size_t total_pages_;
  std::string report_title_;
};

}  // namespace pdfasm::pdf
