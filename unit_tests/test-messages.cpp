#include <gtest/gtest.h>
#include "vecto/Messages.h"
#include "vecto/Vector2.h"

#include <sstream>
#include <vector>

using namespace Vecto;

class MessagesTest : public ::testing::Test {
protected:
  void SetUp() override {
    level_ = Messages::OptStream::level();
    Messages::OptStream::set_stream(captured_);
  }

  void TearDown() override {
    Messages::OptStream::set_level(level_);
    Messages::OptStream::set_stream(std::cerr);
  }

  std::ostringstream captured_;
  Messages::Type level_;
};

TEST_F(MessagesTest, DefaultLevels) {
  EXPECT_EQ(Messages::Default, Messages::OptStream::level());
  EXPECT_EQ(Messages::DefaultAbort, Messages::OptStream::abort_level());
}

TEST_F(MessagesTest, PrefixesByType) {
  Messages::out(Messages::Warning) << "careful " << 3 << "\n";
  Messages::out(Messages::Info) << "plain\n";
  EXPECT_EQ("WARNING: careful 3\nplain\n", captured_.str());
}

TEST_F(MessagesTest, LevelFiltersOutput) {
  Messages::OptStream::set_level(Messages::Warning);
  Messages::out(Messages::Info) << "hidden\n";
  Messages::out(Messages::Warning) << "shown\n";
  EXPECT_EQ("WARNING: shown\n", captured_.str());
}

TEST_F(MessagesTest, StreamsVectors) {
  Messages::out(Messages::Info) << Geometry::Vector2i(1, -2);
  EXPECT_EQ("(1, -2)", captured_.str());
}

TEST_F(MessagesTest, RejectedSliceIsReportedAtDebug) {
  std::vector<int> three = {1, 2, 3};

  EXPECT_THROW(Geometry::Vector2i::from_slice(three), Geometry::InvalidLength);
  EXPECT_EQ("", captured_.str()) << "Debug is above the default level";

  Messages::OptStream::set_level(Messages::Debug);
  EXPECT_THROW(Geometry::Vector2i::from_slice(three), Geometry::InvalidLength);
  EXPECT_EQ("DEBUG: Vector2 needs 2 values, got 3\n", captured_.str());
}

TEST(MessagesDeathTest, ErrorTerminates) {
  ASSERT_DEATH({
    Messages::out(Messages::Error) << "Test Error\n";
  }, "ERROR: Test Error");
}
