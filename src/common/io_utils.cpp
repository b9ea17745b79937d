#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace autograder {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create file " + path.string());
    fout << content;
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

const string &assert_safe_id(const string &id) {
    if (id.empty())
        throw invalid_argument("identifier is empty");
    bool safe = all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
    if (!safe)
        throw invalid_argument("identifier is not safe " + id);
    return id;
}

scoped_file_lock::scoped_file_lock() : fd(-1), valid(false) {}

scoped_file_lock::scoped_file_lock(const fs::path &path, bool shared) : fd(-1), valid(false), lock_file(path) {
    fd = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to open lock file " + path.string());
    int ret;
    do {
        ret = flock(fd, shared ? LOCK_SH : LOCK_EX);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) {
        int err = errno;
        close(fd);
        throw system_error(err, system_category(), "unable to lock " + path.string());
    }
    valid = true;
}

scoped_file_lock::scoped_file_lock(scoped_file_lock &&lock) : fd(-1), valid(false) {
    *this = move(lock);
}

scoped_file_lock::~scoped_file_lock() {
    release();
}

scoped_file_lock &scoped_file_lock::operator=(scoped_file_lock &&lock) {
    swap(fd, lock.fd);
    swap(valid, lock.valid);
    swap(lock_file, lock.lock_file);
    return *this;
}

bool scoped_file_lock::owns_lock() const {
    return valid;
}

void scoped_file_lock::release() {
    if (!valid) return;
    flock(fd, LOCK_UN);
    close(fd);
    valid = false;
}

scoped_file_lock lock_file(const fs::path &path, bool shared) {
    fs::create_directories(path.parent_path());
    return scoped_file_lock(path, shared);
}

}  // namespace autograder
