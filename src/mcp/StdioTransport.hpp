#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace gemini_mcp {

/**
 * @brief Newline-delimited JSON over standard streams
 *
 * One message per line. Blank lines are skipped; stdout carries nothing
 * but protocol messages, so logging must go elsewhere.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace gemini_mcp
