#pragma once

#include <array>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>

namespace sightline_rt::transport {

// Read end of an ordered byte stream (stdin unless told otherwise). Owns the
// descriptor and closes it on destruction.
class PipeReader {
  public:
    explicit PipeReader(int fd = STDIN_FILENO);
    ~PipeReader();

    PipeReader(const PipeReader &) = delete;
    PipeReader &operator=(const PipeReader &) = delete;
    PipeReader(PipeReader &&other) noexcept;
    PipeReader &operator=(PipeReader &&other) noexcept;

    // Block until bytes are available and append them to data.
    // Returns end_of_stream once the writer has closed its end.
    std::error_code Read(std::string &data);

    bool IsTerminal() const;

    void Close();

  private:
    int fd_;
    std::array<char, 4096> chunk_{};
};

// Write end of an ordered byte stream (stdout unless told otherwise). Owns
// the descriptor and closes it on destruction.
class PipeWriter {
  public:
    explicit PipeWriter(int fd = STDOUT_FILENO);
    ~PipeWriter();

    PipeWriter(const PipeWriter &) = delete;
    PipeWriter &operator=(const PipeWriter &) = delete;
    PipeWriter(PipeWriter &&other) noexcept;
    PipeWriter &operator=(PipeWriter &&other) noexcept;

    // Write all of data. Blocks while the reader is slow; a partial write is
    // resumed, never abandoned. Returns broken_pipe once the reader is gone.
    std::error_code Write(std::string_view data);

    bool IsTerminal() const;

    // Close the write end; the reader sees a clean end-of-stream.
    void Close();

  private:
    int fd_;
};

} // namespace sightline_rt::transport
