// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Persisting container output at teardown

#include "faultline/topology/log_capture.hpp"

#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace faultline {
namespace topology {

namespace {

const char* const CATEGORY = "Deployment";

core::Result<void, core::Error> writeGzip(const std::string& path, const std::string& content) {
    using Res = core::Result<void, core::Error>;

    gzFile file = gzopen(path.c_str(), "wb");
    if (file == nullptr) {
        return Res::error(core::Error(core::ErrorCode::LogCaptureFailed,
            std::string("gzopen: ") + std::strerror(errno), path));
    }

    // gzwrite takes an unsigned length; write in bounded slices.
    const size_t slice = 1u << 20;
    size_t offset = 0;
    while (offset < content.size()) {
        size_t len = std::min(slice, content.size() - offset);
        int written = gzwrite(file, content.data() + offset, static_cast<unsigned>(len));
        if (written <= 0) {
            int zerr = Z_OK;
            std::string message = gzerror(file, &zerr);
            gzclose(file);
            return Res::error(core::Error(core::ErrorCode::LogCaptureFailed, "gzwrite: " + message, path));
        }
        offset += static_cast<size_t>(written);
    }

    int rc = gzclose(file);
    if (rc != Z_OK) {
        return Res::error(core::Error(core::ErrorCode::LogCaptureFailed,
            "gzclose failed with " + std::to_string(rc), path));
    }
    return Res::success();
}

core::Result<void, core::Error> writePlain(const std::string& path, const std::string& content) {
    using Res = core::Result<void, core::Error>;

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Res::error(core::Error(core::ErrorCode::LogCaptureFailed,
            std::string("cannot open: ") + std::strerror(errno), path));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (file.fail()) {
        return Res::error(core::Error(core::ErrorCode::LogCaptureFailed, "write failed", path));
    }
    return Res::success();
}

} // namespace

std::string containerLogPath(const std::string& directory, const std::string& name, bool compress) {
    std::string path = directory.empty() ? "." : directory;
    if (path.back() != '/') {
        path += '/';
    }
    path += "container-" + name + ".log";
    if (compress) {
        path += ".gz";
    }
    return path;
}

core::Result<std::string, core::Error> writeContainerLog(const std::string& directory,
                                                         const std::string& name,
                                                         const std::string& content,
                                                         bool compress) {
    using Res = core::Result<std::string, core::Error>;

    if (name.empty()) {
        return Res::error(core::Error(core::ErrorCode::InvalidArgument, "container name is required", CATEGORY));
    }

    std::string path = containerLogPath(directory, name, compress);
    auto written = compress ? writeGzip(path, content) : writePlain(path, content);
    if (written.isError()) {
        return Res::error(written.error());
    }
    return Res::success(path);
}

} // namespace topology
} // namespace faultline
