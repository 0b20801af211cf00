//
// Created by Malik T on 13/08/2025.
//

#ifndef KLONDIKE_OMEGAEXCEPTION_HPP
#define KLONDIKE_OMEGAEXCEPTION_HPP
#include <cstddef>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace klondike::core
{
    // Engine misuse, never a player's illegal move. Carries a code, the throw site and the
    // call stack so a failing self-play run can be traced without a debugger.
    // (after Peter Muldoon, "Exceptionally bad", CppCon 2023)
    template <typename Code>
    class OmegaException
    {
    public:
        OmegaException(std::string message,
                       Code code,
                       std::source_location const& thrown_at = std::source_location::current(),
                       std::stacktrace trace = std::stacktrace::current()) :
            message_{std::move(message)},
            code_{code},
            thrown_at_{thrown_at},
            trace_{std::move(trace)}
        {
        }

        [[nodiscard]] auto what() const noexcept -> std::string const& { return message_; }
        [[nodiscard]] auto code() const noexcept -> Code { return code_; }
        [[nodiscard]] auto where() const noexcept -> std::source_location const& { return thrown_at_; }
        [[nodiscard]] auto stack() const noexcept -> std::stacktrace const& { return trace_; }

        // Throw site plus at most max_frames frames. Frame 0 is the throw helper itself.
        [[nodiscard]] auto to_str(size_t const max_frames = 12) const -> std::string
        {
            std::string s = std::format("  at {}:{} in {}\n", thrown_at_.file_name(), thrown_at_.line(),
                                        thrown_at_.function_name());
            size_t shown{};
            for (size_t i = 1; i < trace_.size() && shown < max_frames; ++i, ++shown)
            {
                std::stacktrace_entry const& frame = trace_[i];
                if (frame.source_file().empty())
                    s += std::format("  #{} {}\n", shown, frame.description());
                else
                    s += std::format("  #{} {} ({}:{})\n", shown, frame.description(), frame.source_file(),
                                     frame.source_line());
            }
            return s;
        }

    private:
        std::string message_;
        Code code_;
        std::source_location thrown_at_;
        std::stacktrace trace_;
    };
}

// std::print(stderr, "{}", e)
template <class Code>
struct std::formatter<klondike::core::OmegaException<Code>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(klondike::core::OmegaException<Code> const& e, FormatContext& ctx) const
    {
        std::string const s = std::format("[klondike] error {}: {}\n{}", static_cast<unsigned>(e.code()), e.what(),
                                          e.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //KLONDIKE_OMEGAEXCEPTION_HPP
