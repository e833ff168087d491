#pragma once

#include "pycomp/python.hpp"

#include <bit>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace pycomp::internal {

    // Protocol 2 pickle opcodes
    namespace pickle_op {
        inline constexpr char proto = '\x80';
        inline constexpr char stop = '.';
        inline constexpr char none = 'N';
        inline constexpr char newtrue = '\x88';
        inline constexpr char newfalse = '\x89';
        inline constexpr char binint = 'J';
        inline constexpr char binint1 = 'K';
        inline constexpr char binint2 = 'M';
        inline constexpr char long1 = '\x8a';
        inline constexpr char binfloat = 'G';
        inline constexpr char binunicode = 'X';
        inline constexpr char mark = '(';
        inline constexpr char empty_list = ']';
        inline constexpr char appends = 'e';
        inline constexpr char empty_tuple = ')';
        inline constexpr char tuple = 't';
        inline constexpr char tuple1 = '\x85';
        inline constexpr char tuple2 = '\x86';
        inline constexpr char tuple3 = '\x87';
        inline constexpr char empty_dict = '}';
        inline constexpr char setitems = 'u';
        inline constexpr char global = 'c';
        inline constexpr char reduce = 'R';
    }  // namespace pickle_op

    /*
     * Minimal protocol 2 pickler. Output is accepted by `pickle.loads` on any Python 3;
     * no memo entries are written, so shared references are pickled by value.
     */
    class pickle_writer {
      public:
        pickle_writer() {
            out_.push_back(pickle_op::proto);
            out_.push_back('\x02');
        }

        pickle_writer& value(const py_value& v) {
            std::visit([this](const auto& alternative) { write(alternative); }, v.data);
            return *this;
        }

        pickle_writer& str(std::string_view utf8) {
            out_.push_back(pickle_op::binunicode);
            append_le(static_cast<uint32_t>(utf8.size()), 4U);
            out_.append(utf8);
            return *this;
        }

        pickle_writer& empty_dict() {
            out_.push_back(pickle_op::empty_dict);
            return *this;
        }

        // Pushes `module.name(*args)`; `write_args` writes exactly `arg_count` (1 to 3) values.
        template <typename F>
        pickle_writer& call(std::string_view module, std::string_view name, size_t arg_count, F&& write_args) {
            out_.push_back(pickle_op::global);
            out_.append(module);
            out_.push_back('\n');
            out_.append(name);
            out_.push_back('\n');
            std::forward<F>(write_args)(*this);
            out_.push_back(arg_count == 1U ? pickle_op::tuple1 : arg_count == 2U ? pickle_op::tuple2 : pickle_op::tuple3);
            out_.push_back(pickle_op::reduce);
            return *this;
        }

        // Appends STOP and hands over the buffer; the writer is left empty.
        std::string finish() {
            out_.push_back(pickle_op::stop);
            return std::exchange(out_, std::string{});
        }

      private:
        std::string out_{};

        void append_le(uint64_t v, size_t width) {
            for (size_t i = 0U; i < width; ++i) {
                out_.push_back(static_cast<char>((v >> (8U * i)) & 0xFFU));
            }
        }

        void write(const py_none&) { out_.push_back(pickle_op::none); }

        void write(bool b) { out_.push_back(b ? pickle_op::newtrue : pickle_op::newfalse); }

        void write(int64_t v) {
            if (v >= 0 && v <= 0xFF) {
                out_.push_back(pickle_op::binint1);
                append_le(static_cast<uint64_t>(v), 1U);
            }
            else if (v >= 0 && v <= 0xFFFF) {
                out_.push_back(pickle_op::binint2);
                append_le(static_cast<uint64_t>(v), 2U);
            }
            else if (v >= INT32_MIN && v <= INT32_MAX) {
                out_.push_back(pickle_op::binint);
                append_le(static_cast<uint32_t>(static_cast<int32_t>(v)), 4U);
            }
            else {
                // two's complement, little endian, minimal length
                std::string bytes{};
                auto u = static_cast<uint64_t>(v);
                for (size_t i = 0U; i < 8U; ++i) {
                    bytes.push_back(static_cast<char>((u >> (8U * i)) & 0xFFU));
                }
                while (bytes.size() > 1U) {
                    auto last = static_cast<uint8_t>(bytes.back());
                    auto prev = static_cast<uint8_t>(bytes[bytes.size() - 2U]);
                    if ((last == 0x00U && (prev & 0x80U) == 0U) || (last == 0xFFU && (prev & 0x80U) != 0U)) {
                        bytes.pop_back();
                        continue;
                    }
                    break;
                }
                out_.push_back(pickle_op::long1);
                out_.push_back(static_cast<char>(bytes.size()));
                out_ += bytes;
            }
        }

        void write(double d) {
            out_.push_back(pickle_op::binfloat);
            auto bits = std::bit_cast<uint64_t>(d);
            for (int shift = 56; shift >= 0; shift -= 8) {
                out_.push_back(static_cast<char>((bits >> shift) & 0xFFU));
            }
        }

        void write(const std::string& s) { str(s); }

        void write(const py_sequence& seq) {
            if (!seq.is_tuple) {
                out_.push_back(pickle_op::empty_list);
                if (!seq.items.empty()) {
                    out_.push_back(pickle_op::mark);
                    for (const auto& item : seq.items) {
                        value(item);
                    }
                    out_.push_back(pickle_op::appends);
                }
                return;
            }
            switch (seq.items.size()) {
                case 0:
                    out_.push_back(pickle_op::empty_tuple);
                    return;
                case 1:
                    value(seq.items[0]);
                    out_.push_back(pickle_op::tuple1);
                    return;
                case 2:
                    value(seq.items[0]);
                    value(seq.items[1]);
                    out_.push_back(pickle_op::tuple2);
                    return;
                case 3:
                    value(seq.items[0]);
                    value(seq.items[1]);
                    value(seq.items[2]);
                    out_.push_back(pickle_op::tuple3);
                    return;
                default:
                    out_.push_back(pickle_op::mark);
                    for (const auto& item : seq.items) {
                        value(item);
                    }
                    out_.push_back(pickle_op::tuple);
                    return;
            }
        }

        void write(const py_dict& dict) {
            out_.push_back(pickle_op::empty_dict);
            if (dict.keys.empty()) {
                return;
            }
            out_.push_back(pickle_op::mark);
            for (size_t i = 0U; i < dict.keys.size(); ++i) {
                value(dict.keys[i]);
                value(dict.values[i]);
            }
            out_.push_back(pickle_op::setitems);
        }
    };

}  // namespace pycomp::internal
