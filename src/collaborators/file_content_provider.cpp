#include <tickloop/collaborators/file_content_provider.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace TickLoop {

namespace {

    // iostreams do not promise to set errno: callers clear it before the
    // operation and fall back to a generic I/O error when nothing was set.
    std::string failureReason(int err) {
        if (err == 0) {
            return std::make_error_code(std::errc::io_error).message();
        }
        return std::generic_category().message(err);
    }

    bool readAll(const std::string& path, std::string& out) {
        errno = 0;
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            return false;
        }
        out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
        return !ifs.bad();
    }

} // namespace

std::string FileContentProvider::operator()(const std::string& path) const {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        spdlog::warn("[FileContentProvider] Cannot stat {}: {}", path, ec.message());
        return "Error reading file: " + ec.message();
    }

    if (!exists) {
        spdlog::info("[FileContentProvider] {} does not exist, creating it", path);
        return createWithPlaceholder(path);
    }

    bool directory = std::filesystem::is_directory(path, ec);
    if (ec) {
        spdlog::warn("[FileContentProvider] Cannot stat {}: {}", path, ec.message());
        return "Error reading file: " + ec.message();
    }
    if (directory) {
        std::string reason = std::make_error_code(std::errc::is_a_directory).message();
        spdlog::warn("[FileContentProvider] Failed to read {}: {}", path, reason);
        return "Error reading file: " + reason;
    }

    std::string contents;
    if (!readAll(path, contents)) {
        std::string reason = failureReason(errno);
        spdlog::warn("[FileContentProvider] Failed to read {}: {}", path, reason);
        return "Error reading file: " + reason;
    }
    return contents;
}

std::string FileContentProvider::createWithPlaceholder(const std::string& path) const {
    {
        errno = 0;
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            std::string reason = failureReason(errno);
            spdlog::warn("[FileContentProvider] Failed to create {}: {}", path, reason);
            return "Error creating file: " + reason;
        }
        errno = 0;
        ofs << placeholder_;
        ofs.flush();
        if (!ofs) {
            std::string reason = failureReason(errno);
            spdlog::warn("[FileContentProvider] Failed to write {}: {}", path, reason);
            return "Error creating file: " + reason;
        }
    }

    std::string contents;
    if (!readAll(path, contents)) {
        std::string reason = failureReason(errno);
        spdlog::warn("[FileContentProvider] Failed to read back {}: {}", path, reason);
        return "Error reading file: " + reason;
    }
    return contents;
}

} // namespace TickLoop
