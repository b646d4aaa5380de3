// Orexa - Game Server Supervisor
// Server artifact providers implementation

#include "orexa/supervisor/artifact_provider.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace orexa {
namespace supervisor {

namespace {

constexpr const char* ARTIFACT_FILE = "server.jar";
constexpr const char* CHECKSUM_SUFFIX = ".sha256";
constexpr const char* LAUNCHER_FILE = "run.sh";
constexpr size_t HASH_CHUNK_SIZE = 64 * 1024;

core::Result<void, core::Error> copyInto(const fs::path& source, const fs::path& destDir) {
    fs::path target = destDir / source.filename();
    fs::path temp = destDir / ("." + source.filename().string() + ".tmp");

    std::error_code ec;
    fs::copy_file(source, temp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(temp, ec);
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::DownloadFailed,
                        "failed to copy " + source.filename().string() + ": " + ec.message(),
                        target.string()));
    }
    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::DownloadFailed,
                        "failed to install " + source.filename().string() + ": " + ec.message(),
                        target.string()));
    }
    return core::Result<void, core::Error>::success();
}

} // anonymous namespace

// =============================================================================
// ArtifactProviderRegistry
// =============================================================================

void ArtifactProviderRegistry::registerProvider(const std::string& type,
                                                std::shared_ptr<IArtifactProvider> provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[core::toLower(type)] = std::move(provider);
}

core::Result<std::shared_ptr<IArtifactProvider>, core::Error> ArtifactProviderRegistry::find(
    const std::string& type) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(core::toLower(type));
    if (it == providers_.end() || !it->second) {
        return core::Result<std::shared_ptr<IArtifactProvider>, core::Error>::error(
            core::Error(core::ErrorCode::ProviderNotFound, "unsupported server type: " + type));
    }
    return core::Result<std::shared_ptr<IArtifactProvider>, core::Error>::success(it->second);
}

std::vector<std::string> ArtifactProviderRegistry::types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(providers_.size());
    for (const auto& entry : providers_) {
        result.push_back(entry.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// =============================================================================
// LocalArtifactProvider
// =============================================================================

LocalArtifactProvider::LocalArtifactProvider(std::string mirrorRoot, std::string type)
    : mirrorRoot_(std::move(mirrorRoot))
    , type_(core::toLower(type))
{
}

std::string LocalArtifactProvider::flavorDir() const {
    return (fs::path(mirrorRoot_) / type_).string();
}

core::Result<std::vector<core::VersionInfo>, core::Error> LocalArtifactProvider::fetchVersions() {
    std::vector<std::string> names;
    std::error_code ec;
    fs::path root(flavorDir());

    if (!fs::is_directory(root, ec)) {
        return core::Result<std::vector<core::VersionInfo>, core::Error>::success({});
    }

    for (fs::directory_iterator it(root, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        if (it->is_directory(ec) && fs::is_regular_file(it->path() / ARTIFACT_FILE, ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return core::Result<std::vector<core::VersionInfo>, core::Error>::error(
            core::Error(core::ErrorCode::FileReadError,
                        "failed to read artifact mirror: " + ec.message(), root.string()));
    }

    std::sort(names.begin(), names.end(),
              [](const std::string& a, const std::string& b) { return versionLess(b, a); });

    std::vector<core::VersionInfo> versions;
    versions.reserve(names.size());
    for (size_t i = 0; i < names.size(); i++) {
        core::VersionInfo info;
        info.version = names[i];
        info.latest = (i == 0);
        versions.push_back(std::move(info));
    }
    return core::Result<std::vector<core::VersionInfo>, core::Error>::success(std::move(versions));
}

core::Result<void, core::Error> LocalArtifactProvider::downloadArtifact(
    const std::string& version,
    const std::string& destDir,
    const ProgressCallback& progress)
{
    if (version.empty() || version.find('/') != std::string::npos || version == "." ||
        version == "..") {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidArgument, "invalid version: " + version));
    }

    fs::path versionDir = fs::path(flavorDir()) / version;
    fs::path artifact = versionDir / ARTIFACT_FILE;
    std::error_code ec;
    if (!fs::is_regular_file(artifact, ec)) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::DownloadFailed,
                        "no " + type_ + " artifact for version " + version, artifact.string()));
    }

    fs::path checksumFile = versionDir / (std::string(ARTIFACT_FILE) + CHECKSUM_SUFFIX);
    if (fs::is_regular_file(checksumFile, ec)) {
        std::ifstream in(checksumFile);
        std::string expected;
        in >> expected;
        expected = core::toLower(expected);

        if (progress) {
            progress("Verifying " + type_ + " " + version + " checksum...");
        }
        auto digest = sha256File(artifact.string());
        if (digest.isError()) {
            return core::Result<void, core::Error>::error(digest.error());
        }
        if (expected.empty() || digest.value() != expected) {
            return core::Result<void, core::Error>::error(
                core::Error(core::ErrorCode::ChecksumMismatch,
                            "checksum mismatch for " + type_ + " " + version +
                            " (expected " + expected + ", got " + digest.value() + ")",
                            artifact.string()));
        }
    }

    fs::create_directories(destDir, ec);
    if (ec) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::DownloadFailed,
                        "failed to create server directory: " + ec.message(), destDir));
    }

    if (progress) {
        auto size = fs::file_size(artifact, ec);
        progress("Copying " + type_ + " " + version + " (" +
                 core::formatFileSize(ec ? 0 : static_cast<uint64_t>(size)) + ")...");
    }
    auto copied = copyInto(artifact, destDir);
    if (copied.isError()) {
        return copied;
    }

    fs::path launcher = versionDir / LAUNCHER_FILE;
    if (fs::is_regular_file(launcher, ec)) {
        copied = copyInto(launcher, destDir);
        if (copied.isError()) {
            return copied;
        }
    }
    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Helpers
// =============================================================================

core::Result<std::string, core::Error> sha256File(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return core::Result<std::string, core::Error>::error(
            core::Error(core::ErrorCode::FileReadError, "cannot open file for hashing", path));
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return core::Result<std::string, core::Error>::error(
            core::Error(core::ErrorCode::Unknown, "failed to initialize SHA-256", path));
    }

    std::vector<char> buffer(HASH_CHUNK_SIZE);
    bool ok = true;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(got)) != 1) {
            ok = false;
            break;
        }
    }
    if (in.bad()) {
        ok = false;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (ok && EVP_DigestFinal_ex(ctx, digest, &digestLength) != 1) {
        ok = false;
    }
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        return core::Result<std::string, core::Error>::error(
            core::Error(core::ErrorCode::FileReadError, "failed to hash file", path));
    }

    static const char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digestLength * 2);
    for (unsigned int i = 0; i < digestLength; i++) {
        hex.push_back(HEX[digest[i] >> 4]);
        hex.push_back(HEX[digest[i] & 0x0F]);
    }
    return core::Result<std::string, core::Error>::success(std::move(hex));
}

bool versionLess(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        bool digitA = std::isdigit(static_cast<unsigned char>(a[i])) != 0;
        bool digitB = std::isdigit(static_cast<unsigned char>(b[j])) != 0;
        if (digitA && digitB) {
            size_t endA = i;
            size_t endB = j;
            while (endA < a.size() && std::isdigit(static_cast<unsigned char>(a[endA]))) endA++;
            while (endB < b.size() && std::isdigit(static_cast<unsigned char>(b[endB]))) endB++;

            std::string numA = a.substr(i, endA - i);
            std::string numB = b.substr(j, endB - j);
            numA.erase(0, std::min(numA.find_first_not_of('0'), numA.size()));
            numB.erase(0, std::min(numB.find_first_not_of('0'), numB.size()));
            if (numA.size() != numB.size()) {
                return numA.size() < numB.size();
            }
            if (numA != numB) {
                return numA < numB;
            }
            i = endA;
            j = endB;
            continue;
        }
        if (a[i] != b[j]) {
            return a[i] < b[j];
        }
        i++;
        j++;
    }
    return (a.size() - i) < (b.size() - j);
}

} // namespace supervisor
} // namespace orexa
