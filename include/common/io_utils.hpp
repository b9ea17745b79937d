#pragma once

#include <filesystem>
#include <string>

namespace autograder {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 原样写入文件，覆盖已有内容
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言标识符只包含小写字母、数字、下划线和连字符
 * 提交和测试点的 id 会被拼进工作目录名、输入文件名和镜像标签里，
 * 如果包含 "../" 或者大写字母，会导致目录遍历攻击或者非法的镜像名。
 * @param id 被检查的标识符
 * @return id 本身
 * @throw std::invalid_argument 标识符不合法
 */
const std::string &assert_safe_id(const std::string &id);

/**
 * @brief 基于 flock 的文件锁
 * 同一个进程内的不同线程各自打开锁文件，因此同样会互斥
 */
struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(scoped_file_lock &&);
    scoped_file_lock(const scoped_file_lock &) = delete;
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    bool owns_lock() const;

    void release();

private:
    int fd;
    bool valid;
    std::filesystem::path lock_file;
};

/**
 * @brief 锁文件
 * 锁文件所在的文件夹不存在时会被创建
 * @param lock_file 锁文件路径
 * @param shared 是否是共享锁，真为共享锁（读锁），假为独占锁（写锁）
 * @return 文件锁，析构时释放
 */
scoped_file_lock lock_file(const std::filesystem::path &lock_file, bool shared);

}  // namespace autograder
