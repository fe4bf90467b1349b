#include "formsave/core/SaveDirectory.hpp"
#include "formsave/utils/ModuleLoggers.hpp"
#include "formsave/utils/RandomName.hpp"
#include <system_error>

namespace formsave {
namespace core {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxCreateAttempts = 16;

} // namespace

Result<SaveDirectory> SaveDirectory::createTemp(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        return errorFromErrno(ec.value(), ErrorCode::DirectoryCreateError,
                              "cannot locate system temp directory");
    }

    for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
        fs::path candidate = base / (prefix + "." + utils::randomAlphanumeric());
        if (fs::create_directory(candidate, ec)) {
            FS_DEBUG("created temp save directory {}", candidate.string());
            return SaveDirectory(std::move(candidate), true);
        }
        if (ec) {
            return errorFromErrno(ec.value(), ErrorCode::DirectoryCreateError,
                                  "failed to create temp directory", candidate.string());
        }
        // 同名目录已存在，换一个名字重试
    }
    return makeError(ErrorCode::DirectoryCreateError, "exhausted temp directory names", base.string());
}

SaveDirectory::~SaveDirectory() {
    if (!temporary_ || path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        FS_WARN("failed to remove temp save directory {}: {}", path_.string(), ec.message());
    } else {
        FS_DEBUG("removed temp save directory {}", path_.string());
    }
}

SaveDirectory::SaveDirectory(SaveDirectory&& other) noexcept
    : path_(std::move(other.path_)), temporary_(other.temporary_) {
    other.path_.clear();
    other.temporary_ = false;
}

SaveDirectory& SaveDirectory::operator=(SaveDirectory&& other) noexcept {
    if (this != &other) {
        SaveDirectory old(std::move(*this));
        path_ = std::move(other.path_);
        temporary_ = other.temporary_;
        other.path_.clear();
        other.temporary_ = false;
    }
    return *this;
}

void SaveDirectory::keep() noexcept {
    temporary_ = false;
}

fs::path SaveDirectory::intoPath() && {
    temporary_ = false;
    return std::move(path_);
}

VoidResult SaveDirectory::remove(MissingDirPolicy policy) {
    std::error_code ec;
    const bool exists = fs::exists(path_, ec);
    if (ec) {
        return errorFromErrno(ec.value(), ErrorCode::DirectoryRemoveError,
                              "failed to stat save directory", path_.string());
    }
    if (!exists) {
        if (policy == MissingDirPolicy::Ignore) {
            temporary_ = false;
            return {};
        }
        return makeError(ErrorCode::FileNotFound, "save directory does not exist", path_.string());
    }

    fs::remove_all(path_, ec);
    if (ec) {
        FS_ERROR("failed to remove save directory {}: {}", path_.string(), ec.message());
        return errorFromErrno(ec.value(), ErrorCode::DirectoryRemoveError,
                              "failed to remove save directory", path_.string());
    }
    FS_INFO("removed save directory {}", path_.string());
    temporary_ = false;
    return {};
}

} // namespace core
} // namespace formsave
