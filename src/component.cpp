#include "pycomp/component.hpp"

#include "pycomp/errors.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>

using namespace pycomp::literals;

namespace pycomp {
    namespace detail {

        template <typename T>
        static std::string serialize_json_payload(const T& payload) {
            std::string json{};
            auto ec = glz::write_json(payload, json);
            if (ec) {
                throw serialization_error("failed to serialize component json payload");
            }
            return json;
        }

        // ── Placeholder records ─────────────────────────────────────────

        struct input_value_record {
            std::string inputValue{};
            struct glaze {
                using T = input_value_record;
                static constexpr auto value = glz::object("inputValue", &T::inputValue);
            };
        };

        struct input_path_record {
            std::string inputPath{};
            struct glaze {
                using T = input_path_record;
                static constexpr auto value = glz::object("inputPath", &T::inputPath);
            };
        };

        struct output_path_record {
            std::string outputPath{};
            struct glaze {
                using T = output_path_record;
                static constexpr auto value = glz::object("outputPath", &T::outputPath);
            };
        };

        struct is_present_record {
            std::string isPresent{};
            struct glaze {
                using T = is_present_record;
                static constexpr auto value = glz::object("isPresent", &T::isPresent);
            };
        };

        struct if_body_record {
            glz::raw_json cond{};
            std::vector<glz::raw_json> then{};
            struct glaze {
                using T = if_body_record;
                static constexpr auto value = glz::object("cond", &T::cond, "then", &T::then);
            };
        };

        struct if_record {
            if_body_record body{};
            struct glaze {
                using T = if_record;
                static constexpr auto value = glz::object("if", &T::body);
            };
        };

        // ── Document records ────────────────────────────────────────────

        struct input_record {
            std::string name{};
            std::optional<std::string> type{};
            std::optional<std::string> default_value{};
            std::optional<bool> optional{};
            struct glaze {
                using T = input_record;
                static constexpr auto value = glz::object(
                        "name", &T::name, "type", &T::type, "default", &T::default_value, "optional", &T::optional);
            };
        };

        struct output_record {
            std::string name{};
            std::optional<std::string> type{};
            struct glaze {
                using T = output_record;
                static constexpr auto value = glz::object("name", &T::name, "type", &T::type);
            };
        };

        struct container_record {
            std::string image{};
            std::vector<glz::raw_json> command{};
            std::vector<glz::raw_json> args{};
            struct glaze {
                using T = container_record;
                static constexpr auto value = glz::object("image", &T::image, "command", &T::command, "args", &T::args);
            };
        };

        struct implementation_record {
            container_record container{};
            struct glaze {
                using T = implementation_record;
                static constexpr auto value = glz::object("container", &T::container);
            };
        };

        struct component_record {
            std::string name{};
            std::optional<std::string> description{};
            std::optional<std::vector<input_record>> inputs{};
            std::optional<std::vector<output_record>> outputs{};
            implementation_record implementation{};
            struct glaze {
                using T = component_record;
                static constexpr auto value = glz::object(
                        "name",
                        &T::name,
                        "description",
                        &T::description,
                        "inputs",
                        &T::inputs,
                        "outputs",
                        &T::outputs,
                        "implementation",
                        &T::implementation);
            };
        };

        static std::vector<glz::raw_json> render_command_line(const command_line& line) {
            std::vector<glz::raw_json> rendered{};
            rendered.reserve(line.size());
            for (const auto& node : line) {
                rendered.push_back(glz::raw_json{render_command_node(node)});
            }
            return rendered;
        }

        static component_record make_component_record(const component_spec& spec) {
            component_record record{};
            record.name = spec.name;
            record.description = spec.description;

            if (!spec.inputs.empty()) {
                record.inputs.emplace();
                for (const auto& input : spec.inputs) {
                    input_record in{};
                    in.name = input.name;
                    in.type = input.type;
                    in.default_value = input.default_value;
                    if (input.optional) {
                        in.optional = true;
                    }
                    record.inputs->push_back(std::move(in));
                }
            }
            if (!spec.outputs.empty()) {
                record.outputs.emplace();
                for (const auto& output : spec.outputs) {
                    record.outputs->push_back(output_record{output.name, output.type});
                }
            }

            record.implementation.container.image = spec.implementation.image;
            record.implementation.container.command = render_command_line(spec.implementation.command);
            record.implementation.container.args = render_command_line(spec.implementation.args);
            return record;
        }

    }  // namespace detail

    const input_spec* component_spec::find_input(std::string_view input_name) const {
        auto it = std::ranges::find(inputs, input_name, &input_spec::name);
        return it == inputs.end() ? nullptr : &*it;
    }

    const output_spec* component_spec::find_output(std::string_view output_name) const {
        auto it = std::ranges::find(outputs, output_name, &output_spec::name);
        return it == outputs.end() ? nullptr : &*it;
    }

    std::string make_name_unique(std::string_view name, const std::vector<std::string>& used, std::string_view separator) {
        std::string unique{name};
        if (std::ranges::find(used, unique) == used.end()) {
            return unique;
        }
        for (size_t index = 2U;; ++index) {
            unique = "{}{}{}"_format(name, separator, index);
            if (std::ranges::find(used, unique) == used.end()) {
                return unique;
            }
        }
    }

    std::string render_command_node(const command_node& node) {
        switch (node.kind) {
            case command_node_kind::literal:
                return detail::serialize_json_payload(node.text);
            case command_node_kind::input_value:
                return detail::serialize_json_payload(detail::input_value_record{node.text});
            case command_node_kind::input_path:
                return detail::serialize_json_payload(detail::input_path_record{node.text});
            case command_node_kind::output_path:
                return detail::serialize_json_payload(detail::output_path_record{node.text});
            case command_node_kind::is_present:
                return detail::serialize_json_payload(detail::is_present_record{node.text});
            case command_node_kind::if_then: {
                if (node.condition.size() != 1U) {
                    throw serialization_error("if placeholder must carry exactly one condition");
                }
                detail::if_record record{};
                record.body.cond = glz::raw_json{render_command_node(node.condition.front())};
                record.body.then = detail::render_command_line(node.then_branch);
                return detail::serialize_json_payload(record);
            }
        }
        throw serialization_error("unknown command node kind");
    }

    std::string dump_component_spec(const component_spec& spec, output_format format) {
        auto record = detail::make_component_record(spec);
        std::string text{};
        switch (format) {
            case output_format::json: {
                auto ec = glz::write<glz::opts{.prettify = true}>(record, text);
                if (ec) {
                    throw serialization_error("failed to serialize component {}"_format(spec.name));
                }
                break;
            }
            case output_format::yaml:
                // flow-style document: compact JSON is a YAML 1.2 subset
                text = detail::serialize_json_payload(record);
                break;
        }
        text.push_back('\n');
        return text;
    }

}  // namespace pycomp
