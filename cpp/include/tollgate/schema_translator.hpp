#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tollgate
{
    /**
     * Tool descriptor as advertised by an MCP server (tools/list entry).
     */
    struct ToolDescriptor
    {
        std::string name;
        std::optional<std::string> description; // rendered as null when absent
        nlohmann::json input_schema = nlohmann::json::object();

        /**
         * Parse the MCP wire shape: {"name", "description", "inputSchema"}.
         * A missing inputSchema is read as {}; a missing name or a non-object
         * inputSchema is a ParsingError.
         */
        static Result<ToolDescriptor> from_json(const nlohmann::json &j);
    };

    /**
     * Chat-completion function-calling tool entry.
     */
    struct FunctionCallSchema
    {
        std::string name;
        std::optional<std::string> description;
        nlohmann::json parameters;
        bool strict{false};

        /** {"type": "function", "function": {name, description, parameters, strict}} */
        nlohmann::json to_json() const;
    };

    /**
     * Converts MCP tool descriptors into function-calling schemas.
     * Stateless; never fails on a well-formed ToolDescriptor.
     */
    class SchemaTranslator
    {
    public:
        /**
         * Copy name, description and input schema; default `required` to []
         * when it is absent or falsy; force strict to false.
         */
        static FunctionCallSchema translate(const ToolDescriptor &tool);

        /** Translate a list of tools, preserving order. */
        static std::vector<FunctionCallSchema> translate_all(const std::vector<ToolDescriptor> &tools);

        /**
         * Parse and translate a JSON document holding a single tool, an array
         * of tools, or an object with a "tools" array. Always returns an array.
         */
        static Result<nlohmann::json> translate_document(const nlohmann::json &doc);

        /**
         * Read a JSON tool document from disk and translate it. An unreadable
         * file is an IOError; invalid JSON is a ParsingError.
         */
        static Result<nlohmann::json> translate_file(const std::string &path);

        /** null, false, 0, "", [] and {} count as falsy. */
        static bool is_falsy(const nlohmann::json &value);
    };

} // namespace tollgate
