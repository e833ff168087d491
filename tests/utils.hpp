#pragma once

#include "pycomp.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/base64.hpp"
#include "../src/internal/lexer.hpp"
#include "../src/internal/pickle.hpp"

extern "C" {
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pycomp::test::detail {
    namespace fs = std::filesystem;

    // Strict inverse of internal::base64_encode; nullopt on malformed input.
    inline std::optional<std::string> base64_decode(std::string_view text) {
        if (text.size() % 4U != 0U) {
            return std::nullopt;
        }

        std::array<int, 256> lookup{};
        lookup.fill(-1);
        for (size_t i = 0U; i < internal::base64_alphabet.size(); ++i) {
            lookup[static_cast<uint8_t>(internal::base64_alphabet[i])] = static_cast<int>(i);
        }

        std::string out{};
        out.reserve(text.size() / 4U * 3U);
        for (size_t i = 0U; i < text.size(); i += 4U) {
            uint32_t chunk = 0U;
            int padding = 0;
            for (size_t j = 0U; j < 4U; ++j) {
                char c = text[i + j];
                if (c == '=') {
                    if (i + 4U != text.size() || j < 2U) {
                        return std::nullopt;
                    }
                    ++padding;
                    chunk <<= 6U;
                    continue;
                }
                if (padding > 0) {
                    return std::nullopt;
                }
                auto value = lookup[static_cast<uint8_t>(c)];
                if (value < 0) {
                    return std::nullopt;
                }
                chunk = (chunk << 6U) | static_cast<uint32_t>(value);
            }
            out.push_back(static_cast<char>((chunk >> 16U) & 0xFFU));
            if (padding < 2) {
                out.push_back(static_cast<char>((chunk >> 8U) & 0xFFU));
            }
            if (padding < 1) {
                out.push_back(static_cast<char>(chunk & 0xFFU));
            }
        }
        return out;
    }

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
        REQUIRE(out.good());
    }

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    inline size_t count_occurrences(std::string_view haystack, std::string_view needle) {
        size_t count = 0U;
        for (auto pos = haystack.find(needle); pos != std::string_view::npos; pos = haystack.find(needle, pos + 1U)) {
            ++count;
        }
        return count;
    }

    // Argument vector for parse_cli; keeps the backing strings alive.
    struct cli_args {
        std::vector<std::string> storage{};
        std::vector<char*> argv{};

        cli_args(std::initializer_list<std::string_view> args) {
            storage.emplace_back("pycomp");
            for (auto arg : args) {
                storage.emplace_back(arg);
            }
            for (auto& arg : storage) {
                argv.push_back(arg.data());
            }
            argv.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(storage.size()); }
        char** data() { return argv.data(); }
    };

    struct process_result {
        int exit_code{-1};
        std::string out{};
        std::string err{};
    };

    // Runs the pycomp executable with `args` and collects its exit code and output.
    inline process_result run_pycomp(const std::vector<std::string>& args) {
        int out_pipe[2]{};
        int err_pipe[2]{};
        REQUIRE(::pipe(out_pipe) == 0);
        REQUIRE(::pipe(err_pipe) == 0);

        auto pid = ::fork();
        REQUIRE(pid >= 0);

        if (pid == 0) {
            ::close(out_pipe[0]);
            ::close(err_pipe[0]);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
            ::close(out_pipe[1]);
            ::close(err_pipe[1]);

            std::vector<const char*> argv{PYCOMP_CLI_PATH};
            for (const auto& arg : args) {
                argv.push_back(arg.c_str());
            }
            argv.push_back(nullptr);
            ::execv(argv[0], const_cast<char* const*>(argv.data()));
            _exit(127);
        }

        ::close(out_pipe[1]);
        ::close(err_pipe[1]);

        process_result result{};
        pollfd fds[2]{{.fd = out_pipe[0], .events = POLLIN, .revents = 0},
                      {.fd = err_pipe[0], .events = POLLIN, .revents = 0}};
        int open_fds = 2;
        while (open_fds > 0) {
            int ret = ::poll(fds, 2, 15000);
            if (ret < 0 && errno == EINTR) {
                continue;
            }
            REQUIRE(ret > 0);
            for (auto& pfd : fds) {
                if (pfd.fd < 0 || pfd.revents == 0) {
                    continue;
                }
                char chunk[4096]{};
                auto n = ::read(pfd.fd, chunk, sizeof(chunk));
                if (n <= 0) {
                    ::close(pfd.fd);
                    pfd.fd = -1;
                    --open_fds;
                    continue;
                }
                auto& sink = pfd.fd == out_pipe[0] ? result.out : result.err;
                sink.append(chunk, static_cast<size_t>(n));
            }
        }

        int status = 0;
        REQUIRE(::waitpid(pid, &status, 0) == pid);
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
        return result;
    }

}  // namespace pycomp::test::detail
