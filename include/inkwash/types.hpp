#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace inkwash {

// Batch job lifecycle states.
enum class JobState : std::uint8_t { Created, Processing, Completed, Cancelled, Failed };

enum class ItemKind : std::uint8_t { File, Folder, Archive };

enum class OutputFormat : std::uint8_t { Auto, Folder, Archive };

enum class MaskStrategy : std::uint8_t { Enclosed, Proximity, None };

// Opaque job identifier.
using JobId = std::string;

// One input source submitted with a job.
struct BatchItem {
    ItemKind kind = ItemKind::File;
    std::filesystem::path path;
    std::string collection;     // library title, optional
    std::string chapter;        // chapter id, optional

    [[nodiscard]] bool hasLibraryTarget() const noexcept { return !collection.empty() && !chapter.empty(); }
};

[[nodiscard]] const char* toString(JobState state) noexcept;
[[nodiscard]] const char* toString(ItemKind kind) noexcept;
[[nodiscard]] const char* toString(OutputFormat format) noexcept;
[[nodiscard]] const char* toString(MaskStrategy strategy) noexcept;

[[nodiscard]] std::optional<ItemKind> parseItemKind(const std::string& value);
[[nodiscard]] std::optional<OutputFormat> parseOutputFormat(const std::string& value);
[[nodiscard]] std::optional<MaskStrategy> parseMaskStrategy(const std::string& value);

[[nodiscard]] inline bool isTerminal(JobState state) noexcept {
    return state == JobState::Completed || state == JobState::Cancelled || state == JobState::Failed;
}

} // namespace inkwash
