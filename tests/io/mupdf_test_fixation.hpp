#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace pageorg {
/**
 * @brief Write a minimal, valid PDF with count empty pages of the given box
 */
inline void WriteBlankPdf(const file_path_t& path, int count, int width, int height) {
  std::vector<std::string> objects;
  objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
  std::string kids;
  for (int i = 0; i < count; ++i) {
    kids += std::to_string(3 + i) + " 0 R ";
  }
  objects.push_back("<< /Type /Pages /Kids [ " + kids + "] /Count " + std::to_string(count) +
                    " >>");
  for (int i = 0; i < count; ++i) {
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " + std::to_string(width) +
                      " " + std::to_string(height) + "] >>");
  }

  std::string              body = "%PDF-1.4\n";
  std::vector<std::size_t> offsets;
  for (std::size_t i = 0; i < objects.size(); ++i) {
    offsets.push_back(body.size());
    body += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }

  const auto xref_offset = body.size();
  body += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
  body += "0000000000 65535 f \n";
  for (const auto offset : offsets) {
    std::string number = std::to_string(offset);
    body += std::string(10 - number.size(), '0') + number + " 00000 n \n";
  }
  body += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\n";
  body += "startxref\n" + std::to_string(xref_offset) + "\n%%EOF\n";

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << body;
}

class MuPdfTests : public ::testing::Test {
 protected:
  file_path_t dir_;

  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("pageorg_mupdf_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    WriteBlankPdf(dir_ / "letter.pdf", 3, 612, 792);
    WriteBlankPdf(dir_ / "small.pdf", 2, 300, 400);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }
};
}  // namespace pageorg
