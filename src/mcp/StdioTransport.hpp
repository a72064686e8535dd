#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace stdio_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads JSON messages line-by-line from the input stream.
 * Writes JSON messages line-by-line to the output stream with flush.
 * Reads and writes are guarded by separate mutexes so a write is never
 * interleaved with another write.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    ReadResult read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;
    void close() override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex read_mutex_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace stdio_mcp
