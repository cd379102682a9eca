//
//  transcoder.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "transcoder.hpp"

#include <cstdio>
#include <sstream>
#include <sys/wait.h>

#include "logging.hpp"
#include "taf_error.hpp"

std::string shell_quote(const std::string &s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string FfmpegTranscoder::command_line(const std::string &path) const {
    std::ostringstream cmd;
    cmd << shell_quote(ffmpeg_path_) << " -hide_banner -loglevel warning -i " << shell_quote(path)
        << " -vn -ac 2 -ar 48000 -c:a libopus -application lowdelay -b:a "
        << settings_.bitrate_kbps << "k -vbr " << (settings_.vbr ? "on" : "off") << " -f ogg -";
    return cmd.str();
}

std::vector<uint8_t> FfmpegTranscoder::to_ogg_opus(const std::string &path) {
    const std::string cmd = command_line(path);
    TF_LOG("debug", "transcode: " << cmd);
    FILE *pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw TafError(TafErrorKind::EncodeError, "failed to launch " + ffmpeg_path_);
    }
    std::vector<uint8_t> out;
    uint8_t buffer[64 * 1024];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        out.insert(out.end(), buffer, buffer + n);
    }
    const bool read_error = ferror(pipe) != 0;
    const int status = pclose(pipe);
    if (read_error) {
        throw TafError(TafErrorKind::EncodeError, "reading transcoder output failed for " + path);
    }
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::ostringstream msg;
        msg << "conversion with ffmpeg failed for " << path << " (status " << status << ")";
        throw TafError(TafErrorKind::EncodeError, msg.str());
    }
    TF_LOG("info", "transcoded " << path << " (" << out.size() << " bytes of Ogg Opus)");
    return out;
}
