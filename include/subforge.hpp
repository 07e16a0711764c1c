//
//  subforge.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "caption.hpp"
#include "format_parser.hpp"
#include "format_serializer.hpp"
#include "optimization_orchestrator.hpp"
#include "status.hpp"
#include "streaming_emitter.hpp"

namespace subforge {

/// @defgroup api SubForge Public API
/// Public, supported C++ interfaces for parsing, converting and optimizing subtitles.
/// @{

/**
 * @brief Return the SubForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Read a whole file; Validation when it cannot be opened or exceeds `max_bytes`.
Status read_subtitle_file(const std::string &path, std::string &bytes,
                          size_t max_bytes = kMaxUploadBytes);  ///< @ingroup api

/// Write bytes to `path`, replacing any existing file.
Status write_output_file(const std::string &path, const std::string &bytes);  ///< @ingroup api

/// Read and parse a subtitle file; the extension of `path` is the declared format.
ParseResult parse_subtitle_file(const std::string &path,
                                const ParseOptions &opts = {});  ///< @ingroup api

/**
 * @brief Convert a subtitle file into another format and write it into `output_dir`.
 *
 * @param input_path Source subtitle file (any supported format).
 * @param format Target format name ("srt", "vtt", ...).
 * @param output_dir Destination directory; empty means the input's directory.
 * @param opts Serializer options (fps, BOM, brand suffix).
 * @return Serialized result; `filename` holds the full path that was written.
 */
SerializeResult convert_subtitle_file(const std::string &input_path, const std::string &format,
                                      const std::string &output_dir,
                                      const SerializeOptions &opts = {});  ///< @ingroup api

/// @}

}  // namespace subforge
