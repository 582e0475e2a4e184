#pragma once

#include <stdexcept>
#include <string>

namespace glove {

// 配置非法（线程数、维度等）：在分配任何内存之前抛出
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument("Invalid configuration: " + what) {}
};

// 持久化文件之间的 V 不一致，或者文件大小与声明的形状不符
class DataIntegrityError : public std::runtime_error {
public:
    explicit DataIntegrityError(const std::string& what)
        : std::runtime_error("Data integrity error: " + what) {}
};

class NotImplementedError : public std::logic_error {
public:
    explicit NotImplementedError(const std::string& what)
        : std::logic_error(what + " is not implemented") {}
};

} // namespace glove
