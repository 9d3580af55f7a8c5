#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Verbose tracing switches shared by the streaming pipeline and the assembler.
// Verbose messages go to the dedicated plog instance kLogInstance.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Escaped head of text, cut at MaxPreview() bytes.
    [[nodiscard]] static std::string Preview(std::string_view text);
    // Escaped tail of text, useful for carried-over chunk context.
    [[nodiscard]] static std::string PreviewTail(std::string_view text);

private:
    static std::string escape(std::string_view text);
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace processing
