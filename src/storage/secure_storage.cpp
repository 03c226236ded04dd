// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <storage/secure_storage.h>
#include <util/logging.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

bool IsValidServiceId(const std::string& serviceId) {
    if (serviceId.empty() || serviceId.size() > 64 || serviceId[0] == '.') {
        return false;
    }
    for (char c : serviceId) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
        if (!ok) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// CMemorySecureStorage
// ============================================================================

bool CMemorySecureStorage::Put(const std::string& serviceId, const std::vector<uint8_t>& blob) {
    std::lock_guard<std::mutex> lock(cs_storage);
    if (fFailWrites || blob.size() > MAX_SECURE_BLOB_SIZE) {
        return false;
    }
    m_blobs[serviceId] = blob;
    nWrites++;
    return true;
}

bool CMemorySecureStorage::Get(const std::string& serviceId, std::optional<std::vector<uint8_t>>& blob) {
    std::lock_guard<std::mutex> lock(cs_storage);
    if (fFailReads) {
        return false;
    }
    auto it = m_blobs.find(serviceId);
    if (it == m_blobs.end()) {
        blob = std::nullopt;
    } else {
        blob = it->second;
    }
    return true;
}

bool CMemorySecureStorage::Delete(const std::string& serviceId) {
    std::lock_guard<std::mutex> lock(cs_storage);
    if (fFailWrites) {
        return false;
    }
    m_blobs.erase(serviceId);
    return true;
}

void CMemorySecureStorage::SetFailReads(bool fail) {
    std::lock_guard<std::mutex> lock(cs_storage);
    fFailReads = fail;
}

void CMemorySecureStorage::SetFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(cs_storage);
    fFailWrites = fail;
}

size_t CMemorySecureStorage::GetWriteCount() const {
    std::lock_guard<std::mutex> lock(cs_storage);
    return nWrites;
}

bool CMemorySecureStorage::Peek(const std::string& serviceId, std::vector<uint8_t>& blob) const {
    std::lock_guard<std::mutex> lock(cs_storage);
    auto it = m_blobs.find(serviceId);
    if (it == m_blobs.end()) {
        return false;
    }
    blob = it->second;
    return true;
}

void CMemorySecureStorage::Poke(const std::string& serviceId, const std::vector<uint8_t>& blob) {
    std::lock_guard<std::mutex> lock(cs_storage);
    m_blobs[serviceId] = blob;
}

// ============================================================================
// CFileSecureStorage
// ============================================================================

namespace {

bool WriteAll(int fd, const uint8_t* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = write(fd, data + total, len - total);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

void SyncDirectory(const std::string& dir) {
    int dirfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirfd >= 0) {
        if (fsync(dirfd) != 0) {
            LogPrintStorage(WARN, "fsync of directory %s failed: %s", dir.c_str(), strerror(errno));
        }
        close(dirfd);
    }
}

} // namespace

CFileSecureStorage::CFileSecureStorage(const std::string& directory) : m_directory(directory) {
    while (m_directory.size() > 1 && m_directory.back() == '/') {
        m_directory.pop_back();
    }
}

std::string CFileSecureStorage::GetPath(const std::string& serviceId) const {
    if (!IsValidServiceId(serviceId)) {
        return std::string();
    }
    return m_directory + "/" + serviceId + ".bin";
}

bool CFileSecureStorage::Put(const std::string& serviceId, const std::vector<uint8_t>& blob) {
    std::lock_guard<std::mutex> lock(cs_storage);

    const std::string path = GetPath(serviceId);
    if (path.empty()) {
        LogPrintStorage(ERROR, "Refusing to store blob under invalid service id");
        return false;
    }
    if (blob.size() > MAX_SECURE_BLOB_SIZE) {
        LogPrintStorage(ERROR, "Blob of %zu bytes exceeds the %zu byte limit", blob.size(), MAX_SECURE_BLOB_SIZE);
        return false;
    }

    const std::string tempPath = path + ".tmp";

    // 0600 from creation; umask cannot widen it
    int fd = open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW,
                  S_IRUSR | S_IWUSR);
    if (fd < 0) {
        LogPrintStorage(ERROR, "Cannot create %s: %s", tempPath.c_str(), strerror(errno));
        return false;
    }
    if (fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        LogPrintStorage(WARN, "Cannot restrict permissions of %s: %s", tempPath.c_str(), strerror(errno));
    }

    if (!WriteAll(fd, blob.data(), blob.size())) {
        LogPrintStorage(ERROR, "Write to %s failed: %s", tempPath.c_str(), strerror(errno));
        close(fd);
        std::remove(tempPath.c_str());
        return false;
    }
    if (fsync(fd) != 0) {
        LogPrintStorage(ERROR, "fsync of %s failed: %s", tempPath.c_str(), strerror(errno));
        close(fd);
        std::remove(tempPath.c_str());
        return false;
    }
    if (close(fd) != 0) {
        LogPrintStorage(ERROR, "close of %s failed: %s", tempPath.c_str(), strerror(errno));
        std::remove(tempPath.c_str());
        return false;
    }

    if (std::rename(tempPath.c_str(), path.c_str()) != 0) {
        LogPrintStorage(ERROR, "Cannot replace %s: %s", path.c_str(), strerror(errno));
        std::remove(tempPath.c_str());
        return false;
    }

    SyncDirectory(m_directory);
    LogPrintStorage(DEBUG, "Stored %zu bytes for %s", blob.size(), serviceId.c_str());
    return true;
}

bool CFileSecureStorage::Get(const std::string& serviceId, std::optional<std::vector<uint8_t>>& blob) {
    std::lock_guard<std::mutex> lock(cs_storage);

    const std::string path = GetPath(serviceId);
    if (path.empty()) {
        LogPrintStorage(ERROR, "Refusing to read blob under invalid service id");
        return false;
    }

    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (fd < 0) {
        if (errno == ENOENT) {
            blob = std::nullopt;
            return true;
        }
        LogPrintStorage(ERROR, "Cannot open %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    struct stat st;
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode) ||
        static_cast<size_t>(st.st_size) > MAX_SECURE_BLOB_SIZE) {
        LogPrintStorage(ERROR, "%s is not a regular file of acceptable size", path.c_str());
        close(fd);
        return false;
    }

    std::vector<uint8_t> data(static_cast<size_t>(st.st_size));
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = read(fd, data.data() + total, data.size() - total);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            LogPrintStorage(ERROR, "Short read from %s", path.c_str());
            close(fd);
            return false;
        }
        total += static_cast<size_t>(n);
    }
    close(fd);

    blob = std::move(data);
    return true;
}

bool CFileSecureStorage::Delete(const std::string& serviceId) {
    std::lock_guard<std::mutex> lock(cs_storage);

    const std::string path = GetPath(serviceId);
    if (path.empty()) {
        return false;
    }

    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        LogPrintStorage(ERROR, "Cannot delete %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    // Stale temp file from an interrupted Put
    const std::string tempPath = path + ".tmp";
    if (unlink(tempPath.c_str()) != 0 && errno != ENOENT) {
        LogPrintStorage(WARN, "Cannot delete %s: %s", tempPath.c_str(), strerror(errno));
    }

    SyncDirectory(m_directory);
    return true;
}
