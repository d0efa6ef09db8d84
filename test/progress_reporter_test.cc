#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

#include "CNPJ.hpp"
#include "CNPJChunkedWriter.hpp"
#include "CNPJProgressReporter.hpp"
#include "test_util.hpp"

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream input(text);
  std::string line;
  while (std::getline(input, line)) {
    lines.push_back(line);
  }
  return lines;
}

// Stream buffer whose every write waits until release() is called.
class GatedBuf : public std::streambuf {
 public:
  GatedBuf() : gate_(open_.get_future().share()) {}

  ~GatedBuf() { release(); }

  void release() {
    if (!released_) {
      released_ = true;
      open_.set_value();
    }
  }

  const std::string& text() const { return text_; }

 protected:
  int_type overflow(int_type c) override {
    gate_.wait();
    if (c != traits_type::eof()) {
      text_.push_back(traits_type::to_char_type(c));
    }
    return traits_type::not_eof(c);
  }

 private:
  std::promise<void> open_;
  std::shared_future<void> gate_;
  std::string text_;
  bool released_ = false;
};

// Opens the gate when leaving scope, so a failed assertion cannot leave the
// reporter thread parked forever.
class GateReleaser {
 public:
  explicit GateReleaser(GatedBuf* buf) : buf_(buf) {}
  ~GateReleaser() { buf_->release(); }

 private:
  GatedBuf* buf_;
};

}  // namespace

TEST(ProgressReporterTest, PrintsLastCountOnStop) {
  std::ostringstream out;
  CNPJProgressReporter reporter(&out, std::chrono::milliseconds(1));
  reporter.Start();
  reporter.Report(5);
  reporter.Report(10);
  reporter.Stop();

  std::vector<std::string> lines = SplitLines(out.str());
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines.back(), "... 10 generated");
}

TEST(ProgressReporterTest, SilentWithoutReports) {
  std::ostringstream out;
  CNPJProgressReporter reporter(&out, std::chrono::milliseconds(1));
  reporter.Start();
  reporter.Stop();
  EXPECT_EQ(out.str(), "");
}

TEST(ProgressReporterTest, StopWithoutStartStillPrints) {
  std::ostringstream out;
  CNPJProgressReporter reporter(&out);
  reporter.Report(3);
  reporter.Stop();
  reporter.Stop();
  EXPECT_EQ(out.str(), "... 3 generated\n");
}

TEST(ProgressReporterTest, WriterKeepsGoingWhileOutputIsStuck) {
  std::string dir = test_util::MakeTempDir();
  ASSERT_FALSE(dir.empty());

  GatedBuf buf;
  std::ostream out(&buf);
  CNPJProgressReporter reporter(&out, std::chrono::milliseconds(1));
  reporter.Start();
  GateReleaser releaser(&buf);
  reporter.Report(1);

  // The reporter thread may now be parked inside the stream; writing must
  // still complete.
  CNPJChunkedWriter writer(1, reporter.Callback());
  ASSERT_TRUE(writer.Open(dir + "/cnpjs", 0, false).ok());
  for (int64_t base = 1; base <= 100; ++base) {
    ASSERT_TRUE(writer.Write(CNPJ::FromBase12(base)).ok());
  }
  ASSERT_TRUE(writer.Close().ok());
  EXPECT_EQ(writer.written(), 100);

  buf.release();
  reporter.Stop();

  std::vector<std::string> lines = SplitLines(buf.text());
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines.back(), "... 100 generated");
  test_util::RemoveTree(dir);
}
