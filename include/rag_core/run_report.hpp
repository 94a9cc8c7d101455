#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "rag_core/run_context.hpp"

namespace rag_core {

// nlohmann ADL hooks; optional fields serialize as null
void to_json(nlohmann::json& j, const Chunk& chunk);
void to_json(nlohmann::json& j, const ParseErrorRecord& record);
void to_json(nlohmann::json& j, const SyntaxErrorReport& report);
void to_json(nlohmann::json& j, const RunStatistics& stats);
void to_json(nlohmann::json& j, const FileRecord& record);

// {repository, stats, files, chunks}
nlohmann::json build_run_report(const RunContext& context);

/**
 * @brief Writes <output_dir>/<repository>_chunks.json, creating the directory.
 * @return Path of the written file.
 * @throw std::runtime_error if the file cannot be written.
 */
std::filesystem::path write_run_report(const RunContext& context,
                                       const std::filesystem::path& output_dir);

// Same, for <output_dir>/<repository>_syntax_errors.json
std::filesystem::path write_syntax_error_report(const RunContext& context,
                                                const std::filesystem::path& output_dir);

}  // namespace rag_core
