#include "app/export_service.hpp"

#include <gtest/gtest.h>

#include <optional>

#include "app/service_test_fixation.hpp"

namespace pageorg {
TEST_F(ServiceTests, ExportHandsPagesToSinkInOrder) {
  ExportService service(sink_, ctx_.Dispatcher());
  auto          alpha = MakeDocument("alpha", 3);
  auto          beta  = MakeDocument("beta", 2);
  const std::vector<PageHandle> pages{{beta, 1}, {alpha, 0}, {alpha, 2}};

  const auto result = service.Export(pages, "/out/merged.pdf");
  EXPECT_TRUE(result.success_);
  const auto written = sink_->Pages();
  ASSERT_EQ(written.size(), 3u);
  EXPECT_EQ(written[0].document_, beta);
  EXPECT_EQ(written[0].page_index_, 1u);
  EXPECT_EQ(written[2].page_index_, 2u);
  EXPECT_EQ(sink_->Destination(), file_path_t("/out/merged.pdf"));
}

TEST_F(ServiceTests, ExportOfNothingFails) {
  ExportService service(sink_, ctx_.Dispatcher());
  const auto    result = service.Export({}, "/out/merged.pdf");
  EXPECT_FALSE(result.success_);
  EXPECT_FALSE(result.message_.empty());
  EXPECT_EQ(sink_->Writes(), 0);
}

TEST_F(ServiceTests, ExportFailureCarriesSinkMessage) {
  ExportService service(sink_, ctx_.Dispatcher());
  sink_->FailWith("disk full");
  const auto result = service.Export({{MakeDocument("alpha", 1), 0}}, "/out/merged.pdf");
  EXPECT_FALSE(result.success_);
  EXPECT_EQ(result.message_, "disk full");
  // No retry
  EXPECT_EQ(sink_->Writes(), 1);
}

TEST_F(ServiceTests, ExportAsyncDeliversOnOwner) {
  ExportService               service(sink_, ctx_.Dispatcher());
  std::optional<ExportResult> result;
  bool                        on_owner = false;
  service.ExportAsync({{MakeDocument("alpha", 1), 0}}, "/out/async.pdf",
                      [&](const ExportResult& r) {
                        on_owner = ctx_.IsOwnerThread();
                        result   = r;
                      });
  ASSERT_TRUE(WaitFor([&result]() { return result.has_value(); }));
  EXPECT_TRUE(result->success_);
  EXPECT_TRUE(on_owner);
}
}  // namespace pageorg
