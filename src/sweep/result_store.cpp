#include "sweep/result_store.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "sweep/errors.hpp"

namespace fs = std::filesystem;

namespace sweep {

namespace {

// Unique within the directory across processes and threads.
std::string temporaryName(const std::string& stem) {
    static std::atomic<unsigned long> counter{0};
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return "." + stem + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(now) + "."
         + std::to_string(counter.fetch_add(1));
}

std::string lastError() {
    return std::error_code(errno, std::generic_category()).message();
}

}  // namespace

FileResultStore::FileResultStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string FileResultStore::pathFor(const SweepIdentity& identity) const {
    return (fs::path(directory_) / (identity.stem() + ".json")).string();
}

std::optional<ResultSet> FileResultStore::load(const SweepIdentity& identity) {
    const auto path = pathFor(identity);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw PersistenceError("cannot open " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError(path + ": " + e.what());
    }

    if (!doc.is_object() || !doc.contains("identity") || doc["identity"] != identity.key) {
        std::cerr << "[WARN] " << path << " belongs to a different sweep, ignoring it." << std::endl;
        return std::nullopt;
    }

    try {
        return ResultSet::fromJson(doc);
    } catch (const std::exception& e) {
        throw PersistenceError(path + ": " + e.what());
    }
}

void FileResultStore::save(const SweepIdentity& identity, const ResultSet& results) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw PersistenceError("cannot create " + directory_ + ": " + ec.message());
    }

    auto doc        = results.toJson();
    doc["identity"] = identity.key;
    doc["digest"]   = identity.digest;

    // Evaluator messages are arbitrary bytes; invalid UTF-8 becomes U+FFFD.
    std::string text;
    try {
        text = doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("cannot serialize sweep " + identity.digest + ": " + e.what());
    }
    text += '\n';

    writeFileAtomically(pathFor(identity), text);
}

void writeFileAtomically(const std::string& path, const std::string& contents) {
    const fs::path target(path);
    const fs::path directory = target.has_parent_path() ? target.parent_path() : fs::path(".");
    const fs::path tmp       = directory / temporaryName(target.filename().string());

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw PersistenceError("cannot write " + tmp.string() + ": " + lastError());
    }

    std::string failure;
    const char* data = contents.data();
    std::size_t left = contents.size();
    while (left > 0) {
        const auto n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            failure = "write failed for " + tmp.string() + ": " + lastError();
            break;
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    if (failure.empty() && ::fsync(fd) != 0) {
        failure = "fsync failed for " + tmp.string() + ": " + lastError();
    }
    if (::close(fd) != 0 && failure.empty()) {
        failure = "close failed for " + tmp.string() + ": " + lastError();
    }

    std::error_code ec;
    if (!failure.empty()) {
        fs::remove(tmp, ec);
        throw PersistenceError(failure);
    }

    // rename(2) replaces the target in one step on POSIX file systems.
    fs::rename(tmp, target, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(tmp, ec);
        throw PersistenceError("cannot move " + tmp.string() + " into " + target.string() + ": " + reason);
    }

    // The rename itself is durable only once the directory entry is on disk.
    const int dirFd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd < 0 || ::fsync(dirFd) != 0) {
        std::cerr << "[WARN] Cannot sync " << directory.string() << ": " << lastError() << std::endl;
    }
    if (dirFd >= 0) {
        ::close(dirFd);
    }
}

}  // namespace sweep
