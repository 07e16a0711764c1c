//
//  subforge.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subforge.hpp"
#include "subforge_version.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include "logging.hpp"

namespace subforge {

std::string version_string() { return SUBFORGE_VERSION_DISPLAY; }

Status read_subtitle_file(const std::string &path, std::string &bytes, size_t max_bytes) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec && size > max_bytes) {
        return make_error(ErrorKind::Validation, "File size exceeds " +
                                                     std::to_string(max_bytes / (1024 * 1024)) +
                                                     "MB limit");
    }
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        SF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return make_error(ErrorKind::Validation, "Cannot open file: " + path);
    }
    bytes.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    if (f.bad()) {
        return make_error(ErrorKind::Validation, "Failed to read file: " + path);
    }
    return ok_status();
}

Status write_output_file(const std::string &path, const std::string &bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        SF_LOG("error", "open for write failed for " << path << " errno=" << errno << " ("
                                                     << std::generic_category().message(errno)
                                                     << ")");
        return make_error(ErrorKind::Serialization, "Cannot write file: " + path);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out.good()) {
        return make_error(ErrorKind::Serialization, "Failed to write file: " + path);
    }
    return ok_status();
}

ParseResult parse_subtitle_file(const std::string &path, const ParseOptions &opts) {
    ParseResult res;
    std::string bytes;
    res.status = read_subtitle_file(path, bytes, opts.max_bytes);
    if (!res.status.ok) {
        return res;
    }
    const std::string name = std::filesystem::path(path).filename().string();
    return parse_subtitles(bytes, name, opts);
}

SerializeResult convert_subtitle_file(const std::string &input_path, const std::string &format,
                                      const std::string &output_dir,
                                      const SerializeOptions &opts) {
    SerializeResult res;
    ParseResult parsed = parse_subtitle_file(input_path);
    if (!parsed.status.ok) {
        res.status = parsed.status;
        return res;
    }
    const std::filesystem::path input(input_path);
    res = build_download(parsed.document, format, input.filename().string(), opts);
    if (!res.status.ok) {
        return res;
    }
    const std::filesystem::path dir =
        output_dir.empty() ? input.parent_path() : std::filesystem::path(output_dir);
    const std::string target = (dir / res.filename).string();
    Status st = write_output_file(target, res.bytes);
    if (!st.ok) {
        res.status = st;
        return res;
    }
    res.filename = target;
    SF_LOG("info", "wrote " << target << " (" << res.bytes.size() << " bytes)");
    return res;
}

}  // namespace subforge
