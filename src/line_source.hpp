#pragma once
#include <string>
#include <optional>
#include <istream>

namespace execrelay {

// Line-oriented text source. next_line() is the only blocking call in a run.
class LineSource {
public:
    virtual ~LineSource() = default;

    // Next line without its terminator (a trailing "\r" is stripped too),
    // or nullopt once the source is closed.
    virtual std::optional<std::string> next_line() = 0;
};

class IstreamLineSource : public LineSource {
public:
    explicit IstreamLineSource(std::istream& in) : in_(in) {}
    std::optional<std::string> next_line() override;

private:
    std::istream& in_;
};

// Reads from a file descriptor it does not own. A final line without a
// newline is still delivered.
class FdLineSource : public LineSource {
public:
    explicit FdLineSource(int fd) : fd_(fd) {}
    std::optional<std::string> next_line() override;

private:
    int fd_;
    std::string buffer_;
    bool eof_ = false;
};

} // namespace execrelay
