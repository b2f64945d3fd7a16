/**
 * @file utils.h
 * @brief 工具函数
 *
 * 包含各种辅助函数：
 * - 字符串处理
 * - Base64 编解码
 * - 随机标识符
 * - 文件操作
 */

#ifndef PLOT_CORE_UTILS_H
#define PLOT_CORE_UTILS_H

#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <random>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <climits>

#include <unistd.h>
#include <sys/stat.h>

namespace plot {

//==============================================================================
// 字符串处理
//==============================================================================

/**
 * @brief 去除首尾空白字符
 */
inline std::string trim(const std::string &s) {
    const char *ws = " \t\r\n\f\v";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

/**
 * @brief 取最后一行（不含换行符）
 */
inline std::string last_line(const std::string &s) {
    size_t pos = s.find_last_of('\n');
    return (pos == std::string::npos) ? s : s.substr(pos + 1);
}

/**
 * @brief 把 \r\n 统一为 \n
 */
inline std::string normalize_newlines(const std::string &s) {
    std::string r;
    r.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') {
            continue;
        }
        r += s[i];
    }
    return r;
}

/**
 * @brief 任意类型转字符串
 */
template <class T>
inline std::string to_string(const T &v) {
    std::ostringstream sout;
    sout << v;
    return sout.str();
}

/**
 * @brief 浮点数转为确定的十进制字面量
 *
 * 总是带小数点或指数，如 12 -> "12.0"，0.5 -> "0.5"
 */
inline std::string float_literal(double v) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.10g", v);
    std::string s = buf;
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

//==============================================================================
// Base64
//==============================================================================

inline std::string base64_encode(const std::string &data) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t n = (static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << 16) |
                     (static_cast<uint32_t>(static_cast<uint8_t>(data[i + 1])) << 8) |
                     static_cast<uint32_t>(static_cast<uint8_t>(data[i + 2]));
        out += alphabet[(n >> 18) & 63];
        out += alphabet[(n >> 12) & 63];
        out += alphabet[(n >> 6) & 63];
        out += alphabet[n & 63];
        i += 3;
    }
    if (i < data.size()) {
        uint32_t n = static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << 16;
        if (i + 1 < data.size()) {
            n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 1])) << 8;
        }
        out += alphabet[(n >> 18) & 63];
        out += alphabet[(n >> 12) & 63];
        out += (i + 1 < data.size()) ? alphabet[(n >> 6) & 63] : '=';
        out += '=';
    }
    return out;
}

/**
 * @brief Base64 解码
 * @param text 编码文本（忽略空白）
 * @param out 解码结果
 * @return 是否为合法的 Base64
 */
inline bool base64_decode(const std::string &text, std::string &out) {
    out.clear();
    uint32_t buf = 0;
    int bits = 0;
    int pad = 0;
    size_t count = 0;
    for (char c : text) {
        int v;
        if (c >= 'A' && c <= 'Z') v = c - 'A';
        else if (c >= 'a' && c <= 'z') v = c - 'a' + 26;
        else if (c >= '0' && c <= '9') v = c - '0' + 52;
        else if (c == '+') v = 62;
        else if (c == '/') v = 63;
        else if (c == '=') { pad++; count++; continue; }
        else if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        else return false;

        if (pad > 0) {
            return false;  // '=' 之后不能再有数据
        }
        buf = (buf << 6) | static_cast<uint32_t>(v);
        bits += 6;
        count++;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buf >> bits) & 0xFF);
        }
    }
    return count % 4 == 0 && pad <= 2;
}

//==============================================================================
// 随机标识符
//==============================================================================

/**
 * @brief 生成 128 位随机标识符（32 个小写十六进制字符）
 */
inline std::string random_hex_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (int part = 0; part < 2; part++) {
        uint64_t v = rng();
        for (int i = 0; i < 16; i++) {
            out += digits[(v >> (60 - 4 * i)) & 0xF];
        }
    }
    return out;
}

//==============================================================================
// 文件操作
//==============================================================================

/**
 * @brief 检查文件是否存在
 */
inline bool file_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

inline bool dir_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

/**
 * @brief 检查是否为可执行的普通文件
 */
inline bool is_executable(const std::string &path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

/**
 * @brief 获取真实路径
 * @return 规范化的绝对路径，失败返回空字符串
 */
inline std::string get_realpath(const std::string &path) {
    char real[PATH_MAX + 1];
    if (realpath(path.c_str(), real) == NULL) {
        return "";
    }
    return real;
}

/**
 * @brief 读取整个文件
 * @return 是否成功
 */
inline bool read_file(const std::string &path, std::string &content) {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) {
        return false;
    }
    std::ostringstream ss;
    ss << fin.rdbuf();
    content = ss.str();
    return true;
}

/**
 * @brief 写入文件（覆盖）
 */
inline bool write_file(const std::string &path, const std::string &content) {
    FILE *f = fopen(path.c_str(), "wb");
    if (!f) {
        return false;
    }
    bool ok = fwrite(content.data(), 1, content.size(), f) == content.size();
    return fclose(f) == 0 && ok;
}

/**
 * @brief 独占创建并写入文件，文件已存在时失败
 */
inline bool write_file_exclusive(const std::string &path, const std::string &content) {
    FILE *f = fopen(path.c_str(), "wbx");
    if (!f) {
        return false;
    }
    bool ok = fwrite(content.data(), 1, content.size(), f) == content.size();
    return fclose(f) == 0 && ok;
}

} // namespace plot

#endif // PLOT_CORE_UTILS_H
