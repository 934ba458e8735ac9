// ==============================================================================
// report.cpp - Представление результатов
// ==============================================================================

#include "fontlist/report.hpp"

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace fontlist::report {

namespace {

constexpr const char* KEY_NAME = "Name";
constexpr const char* KEY_PATH = "Path";
constexpr const char* KEY_SCOPE = "Scope";

rapidjson::Value string_value(const std::string& text,
                              rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), alloc);
    return v;
}

void record_to_rapidjson(const FontRecord& record, rapidjson::Value& out,
                         rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();

    rapidjson::Value name = string_value(record.name, alloc);
    rapidjson::Value path = string_value(record.path, alloc);
    rapidjson::Value scope = string_value(record.scope, alloc);

    out.AddMember(rapidjson::StringRef(KEY_NAME), name, alloc);
    out.AddMember(rapidjson::StringRef(KEY_PATH), path, alloc);
    out.AddMember(rapidjson::StringRef(KEY_SCOPE), scope, alloc);
}

}  // namespace

std::string render_table(const std::vector<FontRecord>& fonts) {
    if (fonts.empty()) {
        return {};
    }

    output::Table table;
    table.set_headers({KEY_NAME, KEY_PATH, KEY_SCOPE});
    for (const auto& font : fonts) {
        table.add_row({font.name, font.path, font.scope});
    }
    return table.to_string();
}

std::string csv_escape(std::string_view field) {
    bool needs_quotes = field.find_first_of(",\"\r\n") != std::string_view::npos;
    if (!needs_quotes) {
        return std::string(field);
    }

    std::string result = "\"";
    for (char c : field) {
        if (c == '"') {
            result += "\"\"";
        } else {
            result += c;
        }
    }
    result += '"';
    return result;
}

std::string render_csv(const std::vector<FontRecord>& fonts) {
    std::string result = std::string(KEY_NAME) + "," + KEY_PATH + "," + KEY_SCOPE + "\n";
    for (const auto& font : fonts) {
        result += csv_escape(font.name);
        result += ',';
        result += csv_escape(font.path);
        result += ',';
        result += csv_escape(font.scope);
        result += '\n';
    }
    return result;
}

std::string render_json(const std::vector<FontRecord>& fonts) {
    rapidjson::Document doc;
    doc.SetArray();
    auto& alloc = doc.GetAllocator();

    for (const auto& font : fonts) {
        rapidjson::Value obj;
        record_to_rapidjson(font, obj, alloc);
        doc.PushBack(obj, alloc);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);

    std::string result(buffer.GetString(), buffer.GetSize());
    result += '\n';
    return result;
}

std::string render_jsonl(const std::vector<FontRecord>& fonts) {
    std::string result;
    for (const auto& font : fonts) {
        rapidjson::Document doc;
        record_to_rapidjson(font, doc, doc.GetAllocator());

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        result.append(buffer.GetString(), buffer.GetSize());
        result += '\n';
    }
    return result;
}

std::string render(const std::vector<FontRecord>& fonts, output::Format format) {
    switch (format) {
    case output::Format::Csv:
        return render_csv(fonts);
    case output::Format::Json:
        return render_json(fonts);
    case output::Format::Jsonl:
        return render_jsonl(fonts);
    case output::Format::Std:
        return render_table(fonts);
    }
    return render_table(fonts);
}

}  // namespace fontlist::report
