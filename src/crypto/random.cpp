// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <crypto/random.h>

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

bool GetStrongRandBytes(uint8_t* buf, size_t len) {
    if (buf == nullptr || len == 0) return false;

    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;

    size_t total = 0;
    while (total < len) {
        ssize_t n = read(fd, buf + total, len - total);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            close(fd);
            return false;
        }
        total += static_cast<size_t>(n);
    }

    close(fd);
    return true;
}
