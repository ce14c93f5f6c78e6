#ifndef TETHER_UTILS_TERMINAL_HPP
#define TETHER_UTILS_TERMINAL_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace Tether::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kRed           = "\033[31m";
        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightCyan    = "\033[96m";

        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
        inline constexpr std::string_view kGoldenrod    = "\033[38;5;221m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck     = "✔";
        inline constexpr std::string_view kCross     = "✘";
        inline constexpr std::string_view kDot       = "•";
        inline constexpr std::string_view kInfo      = "ℹ";

        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kBoxVertical        = "┃";
        inline constexpr std::string_view kRoundedTopLeft     = "╭";
        inline constexpr std::string_view kRoundedTopRight    = "╮";
        inline constexpr std::string_view kRoundedBottomLeft  = "╰";
        inline constexpr std::string_view kRoundedBottomRight = "╯";
    }

    // ---------- Small helpers ----------
    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // ╭━━━━…╮ / ╰━━━━…╯
    inline std::string TopBarRounded(std::size_t inner_len, std::string_view color) {
        using namespace Symbols;
        return ApplyColor(std::string(kRoundedTopLeft) + Repeat(kBoxHorizontal, inner_len) + std::string(kRoundedTopRight), color);
    }
    inline std::string BottomBarRounded(std::size_t inner_len, std::string_view color) {
        using namespace Symbols;
        return ApplyColor(std::string(kRoundedBottomLeft) + Repeat(kBoxHorizontal, inner_len) + std::string(kRoundedBottomRight), color);
    }

    // One status line on an optional stream: "ℹ [tag] message". Null stream means silent.
    inline void Status(std::ostream* stream, std::string_view tag, std::string_view message,
                       std::string_view color = Colors::kBrightCyan, std::string_view symbol = Symbols::kInfo) {
        if (stream == nullptr) {
            return;
        }
        *stream << ApplyColor(symbol, color) << ' '
                << ApplyColor(std::string("[") + std::string(tag) + "]", Colors::kBrightBlack) << ' '
                << message << '\n';
    }
}

#endif // TETHER_UTILS_TERMINAL_HPP
