#include "app/organizer_session.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>

#include "app/service_test_fixation.hpp"

namespace pageorg {
namespace {
auto MakeSession(MainContext& ctx, std::shared_ptr<FakeOpener> opener,
                 std::shared_ptr<RenderBackend> backend, std::shared_ptr<ExportSink> sink)
    -> std::unique_ptr<OrganizerSession> {
  OrganizerConfig config;
  config.log_level_ = "warn";
  return std::make_unique<OrganizerSession>(config, std::move(opener), std::move(backend),
                                            std::move(sink), ctx.Dispatcher());
}
}  // namespace

class OrganizerSessionTests : public ServiceTests {
 protected:
  std::unique_ptr<OrganizerSession> session_;

  void SetUp() override {
    ServiceTests::SetUp();
    session_ = MakeSession(ctx_, opener_, backend_, sink_);
  }

  void TearDown() override {
    ServiceTests::TearDown();
    session_.reset();
  }

  auto AddAndWait(const std::vector<file_path_t>& paths) -> ImportResult {
    std::optional<ImportResult> result;
    session_->AddDocuments(paths, [&result](const ImportResult& r) { result = r; });
    EXPECT_TRUE(session_->is_busy());
    EXPECT_TRUE(WaitFor([&result]() { return result.has_value(); }));
    return result.value_or(ImportResult{});
  }
};

TEST_F(OrganizerSessionTests, AddDocumentsAppendsPagesAndReports) {
  const auto result = AddAndWait({"/docs/alpha.pdf", "/docs/beta.pdf"});
  EXPECT_FALSE(session_->is_busy());
  EXPECT_EQ(result.imported_, 2u);
  EXPECT_EQ(result.pages_added_, 5u);

  const auto& collection = session_->Collection();
  ASSERT_EQ(collection.Size(), 5u);
  EXPECT_EQ(collection.Entries()[0].source_label_, "alpha");
  EXPECT_EQ(collection.Entries()[3].source_label_, "beta");
  EXPECT_EQ(collection.DocumentCount(), 2u);

  ASSERT_TRUE(session_->last_status().has_value());
  EXPECT_TRUE(session_->last_status()->success_);
  EXPECT_EQ(session_->last_status()->message_, "Added 2 document(s)");
}

TEST_F(OrganizerSessionTests, FailedPathIsReportedButOthersAreAdded) {
  AddAndWait({"/docs/alpha.pdf", "/docs/corrupt.pdf"});
  EXPECT_EQ(session_->Collection().Size(), 3u);
  ASSERT_TRUE(session_->last_status().has_value());
  EXPECT_FALSE(session_->last_status()->success_);
}

TEST_F(OrganizerSessionTests, EmptyPathListDoesNothing) {
  EXPECT_EQ(session_->AddDocuments({}), nullptr);
  EXPECT_FALSE(session_->is_busy());
  EXPECT_FALSE(session_->last_status().has_value());
}

TEST_F(OrganizerSessionTests, DeleteSelectedReportsCountOrRejection) {
  AddAndWait({"/docs/alpha.pdf", "/docs/beta.pdf"});
  const auto ids = session_->Collection().Entries();

  session_->SelectAll();
  EXPECT_EQ(session_->DeleteSelected(), 0u);
  EXPECT_EQ(session_->Collection().Size(), 5u);
  EXPECT_FALSE(session_->last_status()->success_);
  EXPECT_EQ(session_->last_status()->message_, "Cannot delete all pages or no pages selected.");

  session_->ClearSelection();
  EXPECT_EQ(session_->DeleteSelected(), 0u);
  EXPECT_FALSE(session_->last_status()->success_);

  session_->Select(ids[3].id_);
  session_->Toggle(ids[4].id_);
  EXPECT_EQ(session_->DeleteSelected(), 2u);
  EXPECT_TRUE(session_->last_status()->success_);
  EXPECT_EQ(session_->last_status()->message_, "Successfully deleted 2 page(s)!");
  EXPECT_EQ(session_->Collection().DocumentCount(), 1u);
}

TEST_F(OrganizerSessionTests, ReorderCommandsForwardToCollection) {
  AddAndWait({"/docs/alpha.pdf"});
  const auto entries = session_->Collection().Entries();

  EXPECT_TRUE(session_->MovePage(entries[0].id_, entries[2].id_));
  EXPECT_EQ(session_->Collection().Entries()[2].id_, entries[0].id_);
  session_->Reverse();
  EXPECT_EQ(session_->Collection().Entries()[0].id_, entries[0].id_);
  EXPECT_TRUE(session_->RemovePage(entries[1].id_));
  EXPECT_EQ(session_->Collection().Size(), 2u);
  EXPECT_FALSE(session_->Deselect(entries[0].id_));

  session_->ClearAll();
  EXPECT_FALSE(session_->Collection().HasPages());
  EXPECT_EQ(session_->Cache().Stats().resident_count_, 0u);
}

TEST_F(OrganizerSessionTests, ExportWritesDisplayOrder) {
  AddAndWait({"/docs/alpha.pdf", "/docs/beta.pdf"});
  session_->Reverse();

  std::optional<ExportResult> result;
  session_->Export("/out/merged.pdf", [&result](const ExportResult& r) { result = r; });
  EXPECT_TRUE(session_->is_busy());
  ASSERT_TRUE(WaitFor([&result]() { return result.has_value(); }));
  EXPECT_FALSE(session_->is_busy());
  EXPECT_TRUE(result->success_);

  const auto pages = sink_->Pages();
  ASSERT_EQ(pages.size(), 5u);
  EXPECT_EQ(pages[0].document_->Label(), "beta");
  EXPECT_EQ(pages[0].page_index_, 1u);
  EXPECT_EQ(pages[4].document_->Label(), "alpha");
  EXPECT_EQ(pages[4].page_index_, 0u);
}

TEST_F(OrganizerSessionTests, ExportFailureMessageIsShownVerbatim) {
  AddAndWait({"/docs/alpha.pdf"});
  sink_->FailWith("Destination is read-only");

  std::optional<ExportResult> result;
  session_->Export("/out/merged.pdf", [&result](const ExportResult& r) { result = r; });
  ASSERT_TRUE(WaitFor([&result]() { return result.has_value(); }));
  EXPECT_FALSE(session_->last_status()->success_);
  EXPECT_EQ(session_->last_status()->message_, "Destination is read-only");
}

TEST_F(OrganizerSessionTests, InvalidConfigIsRejected) {
  OrganizerConfig config;
  config.batch_size_ = 0;
  EXPECT_THROW(OrganizerSession(config, opener_, backend_, sink_, ctx_.Dispatcher()),
               OrganizerError);
}
}  // namespace pageorg
