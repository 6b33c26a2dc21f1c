#include "tollgate/schema_translator.hpp"
#include <cstdint>
#include <format>
#include <fstream>

namespace tollgate
{
    Result<ToolDescriptor> ToolDescriptor::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(TollgateError::parsing("tool descriptor must be a JSON object"));

        ToolDescriptor tool;
        auto name = j.find("name");
        if (name == j.end() || !name->is_string())
            return std::unexpected(TollgateError::parsing("tool descriptor is missing a string 'name'"));
        tool.name = name->get<std::string>();

        if (auto desc = j.find("description"); desc != j.end() && !desc->is_null())
        {
            if (!desc->is_string())
            {
                return std::unexpected(TollgateError::parsing(
                    std::format("tool '{}': 'description' must be a string", tool.name)));
            }
            tool.description = desc->get<std::string>();
        }

        if (auto schema = j.find("inputSchema"); schema != j.end())
        {
            if (!schema->is_object())
            {
                return std::unexpected(TollgateError::parsing(
                    std::format("tool '{}': 'inputSchema' must be a JSON object", tool.name)));
            }
            tool.input_schema = *schema;
        }
        return tool;
    }

    nlohmann::json FunctionCallSchema::to_json() const
    {
        nlohmann::json fn = {
            {"name", name},
            {"description", description ? nlohmann::json(*description) : nlohmann::json(nullptr)},
            {"parameters", parameters},
            {"strict", strict}};
        return nlohmann::json{{"type", "function"}, {"function", fn}};
    }

    bool SchemaTranslator::is_falsy(const nlohmann::json &value)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return true;
        case nlohmann::json::value_t::boolean:
            return !value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<std::int64_t>() == 0;
        case nlohmann::json::value_t::number_unsigned:
            return value.get<std::uint64_t>() == 0;
        case nlohmann::json::value_t::number_float:
            return value.get<double>() == 0.0;
        case nlohmann::json::value_t::string:
            return value.get_ref<const std::string &>().empty();
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
        case nlohmann::json::value_t::binary:
            return value.empty();
        }
        return false;
    }

    FunctionCallSchema SchemaTranslator::translate(const ToolDescriptor &tool)
    {
        FunctionCallSchema out;
        out.name = tool.name;
        out.description = tool.description;
        out.parameters = tool.input_schema;
        out.strict = false;

        if (out.parameters.is_object())
        {
            auto required = out.parameters.find("required");
            if (required == out.parameters.end() || is_falsy(*required))
                out.parameters["required"] = nlohmann::json::array();
        }
        return out;
    }

    std::vector<FunctionCallSchema> SchemaTranslator::translate_all(const std::vector<ToolDescriptor> &tools)
    {
        std::vector<FunctionCallSchema> out;
        out.reserve(tools.size());
        for (const auto &tool : tools)
            out.push_back(translate(tool));
        return out;
    }

    Result<nlohmann::json> SchemaTranslator::translate_document(const nlohmann::json &doc)
    {
        const nlohmann::json *list = nullptr;
        nlohmann::json single = nlohmann::json::array();
        if (doc.is_array())
        {
            list = &doc;
        }
        else if (doc.is_object() && doc.contains("tools") && !doc.contains("name"))
        {
            if (!doc["tools"].is_array())
                return std::unexpected(TollgateError::parsing("'tools' must be a JSON array"));
            list = &doc["tools"];
        }
        else
        {
            single.push_back(doc);
            list = &single;
        }

        std::vector<ToolDescriptor> tools;
        tools.reserve(list->size());
        for (const auto &entry : *list)
        {
            auto tool = ToolDescriptor::from_json(entry);
            if (!tool)
                return std::unexpected(tool.error());
            tools.push_back(std::move(*tool));
        }

        nlohmann::json out = nlohmann::json::array();
        for (const auto &schema : translate_all(tools))
            out.push_back(schema.to_json());
        return out;
    }

    Result<nlohmann::json> SchemaTranslator::translate_file(const std::string &path)
    {
        std::ifstream f(path);
        if (!f.is_open())
            return std::unexpected(TollgateError::io("Unable to open tools file: " + path));

        auto doc = nlohmann::json::parse(f, nullptr, false);
        if (doc.is_discarded())
            return std::unexpected(TollgateError::parsing("Tools file is not valid JSON: " + path));
        return translate_document(doc);
    }

} // namespace tollgate
