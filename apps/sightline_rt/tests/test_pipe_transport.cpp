#include "sightline/core/error.hpp"
#include "sightline_rt/threading/signals.hpp"
#include "sightline_rt/transport/pipe.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <unistd.h>
#include <utility>

using namespace sightline_rt;
using sightline::core::Errc;

int main() {
    std::cout << "=== Testing pipe transport ===" << std::endl;
    threading::signals::Install();

    std::cout << "\n[Test 1] Bytes arrive in order, then end of stream..." << std::endl;
    int fds[2];
    assert(::pipe(fds) == 0);
    transport::PipeReader reader(fds[0]);
    transport::PipeWriter writer(fds[1]);

    assert(!writer.Write("abc"));
    assert(!writer.Write("defg"));
    writer.Close();

    std::string received;
    std::error_code ec;
    while (!(ec = reader.Read(received))) {
    }
    assert(ec == Errc::end_of_stream);
    assert(received == "abcdefg");
    reader.Close();
    std::cout << "  ✓ Read \"" << received << "\" then end_of_stream" << std::endl;

    std::cout << "\n[Test 2] Writes larger than the pipe buffer..." << std::endl;
    // More than the default 64 KiB pipe capacity, written by a child while
    // this process reads
    assert(::pipe(fds) == 0);
    const std::string big(256 * 1024, 'x');
    pid_t child = ::fork();
    assert(child >= 0);
    if (child == 0) {
        ::close(fds[0]);
        transport::PipeWriter child_writer(fds[1]);
        auto write_ec = child_writer.Write(big);
        child_writer.Close();
        ::_exit(write_ec ? 1 : 0);
    }
    ::close(fds[1]);
    transport::PipeReader big_reader(fds[0]);
    std::string big_received;
    while (!(ec = big_reader.Read(big_received))) {
    }
    assert(ec == Errc::end_of_stream);
    assert(big_received == big && "Partial writes must be resumed");
    big_reader.Close();
    std::cout << "  ✓ " << big_received.size() << " bytes delivered intact"
              << std::endl;

    std::cout << "\n[Test 3] Broken pipe once the reader is gone..." << std::endl;
    assert(::pipe(fds) == 0);
    ::close(fds[0]);
    transport::PipeWriter orphan(fds[1]);
    auto broken = orphan.Write("frame");
    assert(broken == Errc::broken_pipe);
    assert(sightline::core::is_clean_termination(broken));
    orphan.Close();
    std::cout << "  ✓ EPIPE reported as " << broken.message() << std::endl;

    std::cout << "\n[Test 4] A pipe is not a terminal..." << std::endl;
    assert(::pipe(fds) == 0);
    transport::PipeReader pipe_reader(fds[0]);
    transport::PipeWriter pipe_writer(fds[1]);
    assert(!pipe_reader.IsTerminal());
    assert(!pipe_writer.IsTerminal());
    pipe_writer.Close();
    pipe_reader.Close();
    std::cout << "  ✓ Both ends report IsTerminal() == false" << std::endl;

    std::cout << "\n[Test 5] Ends own their descriptors..." << std::endl;
    assert(::pipe(fds) == 0);
    transport::PipeReader owner(fds[0]);
    {
        transport::PipeWriter first(fds[1]);
        transport::PipeWriter second(std::move(first));
        assert(first.Write("lost") == Errc::broken_pipe && "Moved-from end is empty");
        assert(!second.Write("kept"));
    }
    // The write end was closed exactly once, when its last owner went away
    std::string owned;
    while (!(ec = owner.Read(owned))) {
    }
    assert(ec == Errc::end_of_stream);
    assert(owned == "kept");

    transport::PipeReader moved(std::move(owner));
    assert(owner.Read(owned) == std::errc::bad_file_descriptor);
    std::cout << "  ✓ Destruction closes, moves transfer ownership" << std::endl;

    std::cout << "\n=== All tests passed! ===" << std::endl;
    return 0;
}
