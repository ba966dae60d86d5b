#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include <arrow/io/interfaces.h>

#include "fswriter/closer.hpp"
#include "fswriter/errors.hpp"

namespace fswriter {
namespace test {

// Output stream that records when it is closed
class RecordingStream : public arrow::io::OutputStream {
public:
    RecordingStream(std::string name, std::vector<std::string>* closed_log, bool fail_close = false)
        : name_(std::move(name)), closed_log_(closed_log), fail_close_(fail_close) {}

    using arrow::io::OutputStream::Write;

    arrow::Status Write(const void* /*data*/, int64_t nbytes) override {
        position_ += nbytes;
        return arrow::Status::OK();
    }

    arrow::Status Close() override {
        closed_log_->push_back(name_);
        closed_ = true;
        if (fail_close_) {
            return arrow::Status::IOError("close failed for " + name_);
        }
        return arrow::Status::OK();
    }

    arrow::Result<int64_t> Tell() const override { return position_; }
    bool closed() const override { return closed_; }

private:
    std::string name_;
    std::vector<std::string>* closed_log_;
    bool fail_close_;
    bool closed_ = false;
    int64_t position_ = 0;
};

TEST(CloserTest, ClosesInReverseRegistrationOrder) {
    std::vector<std::string> closed;
    Closer closer;
    closer.register_stream(std::make_shared<RecordingStream>("raw", &closed));
    closer.register_stream(std::make_shared<RecordingStream>("gzip", &closed));
    closer.register_stream(std::make_shared<RecordingStream>("base64", &closed));
    EXPECT_EQ(closer.size(), 3u);

    closer.close();

    EXPECT_EQ(closed, (std::vector<std::string>{"base64", "gzip", "raw"}));
    EXPECT_EQ(closer.size(), 0u);
}

TEST(CloserTest, RegisterReturnsSameStream) {
    std::vector<std::string> closed;
    Closer closer;
    auto stream = std::make_shared<RecordingStream>("raw", &closed);
    auto registered = closer.register_stream(stream);
    EXPECT_EQ(registered.get(), stream.get());
}

TEST(CloserTest, SkipsStreamsAlreadyClosed) {
    std::vector<std::string> closed;
    Closer closer;
    auto raw = closer.register_stream(std::make_shared<RecordingStream>("raw", &closed));
    closer.register_stream(std::make_shared<RecordingStream>("top", &closed));
    ASSERT_TRUE(raw->Close().ok());

    closer.close();

    EXPECT_EQ(closed, (std::vector<std::string>{"raw", "top"}));
}

TEST(CloserTest, ClosesEverythingAndThrowsFirstFailure) {
    std::vector<std::string> closed;
    Closer closer;
    closer.register_stream(std::make_shared<RecordingStream>("a", &closed, true));
    closer.register_stream(std::make_shared<RecordingStream>("b", &closed, true));
    closer.register_stream(std::make_shared<RecordingStream>("c", &closed));

    try {
        closer.close();
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_NE(std::string(e.what()).find("close failed for b"), std::string::npos);
    }
    EXPECT_EQ(closed, (std::vector<std::string>{"c", "b", "a"}));

    // Nothing left to close
    EXPECT_NO_THROW(closer.close());
    EXPECT_EQ(closed.size(), 3u);
}

TEST(CloserTest, DestructorReleasesStreams) {
    std::vector<std::string> closed;
    {
        Closer closer;
        closer.register_stream(std::make_shared<RecordingStream>("raw", &closed, true));
    }
    EXPECT_EQ(closed, (std::vector<std::string>{"raw"}));
}

}  // namespace test
}  // namespace fswriter
