#include <gtest/gtest.h>
#include "client/base64_session.hpp"
#include "transform/builtin_transforms.hpp"
#include "test_utils.hpp"

using namespace docpipe;
using namespace docpipe::client;

class Base64SessionTest : public ::testing::Test {
protected:
  store::ContentStore store;
  transform::TransformCatalog catalog;
  std::unique_ptr<transform::TransformPipeline> pipeline;
  std::unique_ptr<Base64Session> session;

  void SetUp() override {
    init_test_logging();
    transform::register_builtin_transforms(catalog);
    pipeline = std::make_unique<transform::TransformPipeline>(store, catalog);
    session = std::make_unique<Base64Session>(*pipeline);
  }
};

TEST_F(Base64SessionTest, PlainSideDerivesEncoding) {
  session->set_plain("Hello, World!");

  const Base64View view = session->view();
  EXPECT_EQ(view.plain, "Hello, World!");
  EXPECT_EQ(view.encoded, "SGVsbG8sIFdvcmxkIQ==");
  EXPECT_EQ(view.error, "");
  EXPECT_EQ(session->edited_side(), Base64Session::Side::PLAIN);
}

TEST_F(Base64SessionTest, EncodedSideDerivesPlain) {
  session->set_encoded("SGVsbG8sIFdvcmxkIQ==");

  const Base64View view = session->view();
  EXPECT_EQ(view.plain, "Hello, World!");
  EXPECT_EQ(view.encoded, "SGVsbG8sIFdvcmxkIQ==");
  EXPECT_EQ(view.error, "");
}

TEST_F(Base64SessionTest, InvalidEncodingReportsError) {
  session->set_encoded("not base64!");

  const Base64View view = session->view();
  EXPECT_EQ(view.plain, "");
  EXPECT_EQ(view.encoded, "not base64!");
  EXPECT_EQ(view.error, "Invalid Base64 string");
}

TEST_F(Base64SessionTest, LastEditWins) {
  session->set_encoded("!!!!");
  session->set_plain("ok");

  const Base64View view = session->view();
  EXPECT_EQ(view.encoded, "b2s=");
  EXPECT_EQ(view.error, "");
}

TEST_F(Base64SessionTest, EmptyInputHasNoError) {
  session->set_encoded("");
  EXPECT_EQ(session->view().error, "");
  EXPECT_EQ(session->view().plain, "");

  session->set_plain("x");
  session->clear();
  EXPECT_EQ(session->view().encoded, "");
  EXPECT_EQ(session->edited_text(), "");
}

TEST_F(Base64SessionTest, SessionNeverTouchesStore) {
  session->set_plain("data");
  session->view();
  EXPECT_EQ(store.size(), 0u);
}
