#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <string>

namespace autograder::test {

/**
 * @brief 测试用的临时文件夹，析构时删除
 */
struct temp_dir {
    std::filesystem::path path;

    temp_dir() {
        std::string uuid = boost::lexical_cast<std::string>(boost::uuids::random_generator()());
        path = std::filesystem::temp_directory_path() / ("autograder-test-" + uuid);
        std::filesystem::create_directories(path);
    }

    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path operator/(const std::string &name) const {
        return path / name;
    }
};

}  // namespace autograder::test
