#pragma once
/**
 * @file document_store.hpp
 * @brief Loads, parses, serializes and durably writes scene documents.
 *
 * Parsing uses yaml-cpp and applies YAML 1.1 plain-scalar resolution on top of it:
 * quoted scalars are always strings; plain `~`, `null`, `Null`, `NULL` and empty are
 * null; `true/false/yes/no/on/off` (lower, Capitalised, UPPER) are booleans; decimal
 * integers are integers; decimal floats and `.inf`, `-.inf`, `.nan` are floats; anything
 * else is a string. Explicit tags other than `!!str` are rejected.
 *
 * Serialization quotes every string that would otherwise resolve to another type, so
 * `parse(serialize(doc)) == doc` holds for every document.
 *
 * `write()` goes through utils::atomic_write: a concurrent or later `load()` sees either
 * the old or the new file, never a mixture.
 */
#include <filesystem>
#include <string>
#include <string_view>

#include "repair/repair_error.hpp"
#include "repair/scene_document.hpp"
#include "scenefix_utils_export.h"
#include "utils/logger.hpp"

namespace scenefix::repair
{

/// Resolves the text of an untagged plain scalar to its YAML 1.1 value.
SCENEFIX_UTILS_EXPORT AttributeValue resolve_plain_scalar(std::string_view text);

/// True if @p text, written as a plain scalar, would not read back as the same string.
SCENEFIX_UTILS_EXPORT bool needs_quoting(std::string_view text);

/// Text form of a float that reads back as a float (`1.0`, `2.5e+20`, `.inf`, `.nan`).
SCENEFIX_UTILS_EXPORT std::string format_float(double value);

class SCENEFIX_UTILS_EXPORT DocumentStore
{
  public:
    explicit DocumentStore(utils::Logger &logger) noexcept : logger_(logger) {}
    virtual ~DocumentStore() = default;

    DocumentStore(const DocumentStore &) = delete;
    DocumentStore &operator=(const DocumentStore &) = delete;

    /**
     * @brief Reads and parses @p path.
     * @return The document; NotFound if the path does not exist, Io if it cannot be read,
     *         Parse if it is not a well-formed scene document. An empty file loads as an
     *         empty document.
     */
    [[nodiscard]] virtual RepairResult<SceneDocument> load(const std::filesystem::path &path);

    /**
     * @brief Serializes @p doc and atomically replaces @p path with it.
     * @return Io on any failure; the original file is then untouched.
     */
    [[nodiscard]] virtual RepairStatus write(const std::filesystem::path &path,
                                             const SceneDocument &doc);

    /// YAML text of @p doc. Throws std::runtime_error if the emitter rejects the document.
    [[nodiscard]] static std::string serialize(const SceneDocument &doc);

    [[nodiscard]] static RepairResult<SceneDocument> parse(const std::string &text);

  protected:
    [[nodiscard]] utils::Logger &logger() noexcept { return logger_; }

  private:
    utils::Logger &logger_;
};

} // namespace scenefix::repair
