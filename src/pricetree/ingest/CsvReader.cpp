#include "ingest/CsvReader.hpp"

#include "code/CategoryCode.hpp"
#include "log/TaggedLogger.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <utility>

namespace PT {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

struct RecordSink {
    CsvTable&   table;
    bool        haveHeader = false;
    std::size_t line       = 1;

    auto finish(std::vector<std::string>& fields, bool anyQuoted, std::size_t startLine) -> std::optional<Error> {
        bool const blank = fields.size() == 1 && fields.front().empty() && !anyQuoted;
        if (blank) {
            fields.clear();
            return std::nullopt;
        }
        if (!haveHeader) {
            for (auto& name : fields) {
                name = std::string{trim_ascii(name)};
            }
            table.header = std::move(fields);
            haveHeader   = true;
            fields       = {};
            return std::nullopt;
        }
        if (fields.size() != table.header.size()) {
            return Error{Error::Code::MalformedInput,
                         "line " + std::to_string(startLine) + ": expected " + std::to_string(table.header.size())
                                 + " fields, found " + std::to_string(fields.size())};
        }
        table.rows.push_back(std::move(fields));
        fields = {};
        return std::nullopt;
    }
};

} // namespace

auto CsvTable::columnIndex(std::string_view name) const -> std::optional<std::size_t> {
    auto const wanted = trim_ascii(name);
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

auto CsvReader::detectDelimiter(std::string_view text) -> char {
    constexpr std::array<char, 3> candidates{',', ';', '\t'};
    std::array<std::size_t, 3>    counts{};
    bool                          inQuotes = false;
    for (char c : text) {
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && (c == '\n' || c == '\r')) {
            break;
        }
        if (inQuotes) {
            continue;
        }
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            if (c == candidates[i]) {
                ++counts[i];
            }
        }
    }
    std::size_t best = 0;
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        if (counts[i] > counts[best]) {
            best = i;
        }
    }
    return counts[best] > 0 ? candidates[best] : ',';
}

auto CsvReader::parse(std::string_view text, char delimiter) -> Expected<CsvTable> {
    if (text.starts_with(kUtf8Bom)) {
        text.remove_prefix(kUtf8Bom.size());
    }
    if (delimiter == kAutoDelimiter) {
        delimiter = detectDelimiter(text);
    }

    CsvTable   table;
    RecordSink sink{table};

    std::vector<std::string> fields(1);
    bool                     inQuotes    = false;
    bool                     anyQuoted   = false;
    std::size_t              recordStart = 1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char const c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    fields.back().push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
                continue;
            }
            if (c == '\n') {
                ++sink.line;
            }
            fields.back().push_back(c);
            continue;
        }

        if (c == '"' && fields.back().empty()) {
            inQuotes  = true;
            anyQuoted = true;
            continue;
        }
        if (c == delimiter) {
            fields.emplace_back();
            continue;
        }
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            if (auto error = sink.finish(fields, anyQuoted, recordStart)) {
                return std::unexpected(*error);
            }
            fields.assign(1, std::string{});
            anyQuoted   = false;
            recordStart = ++sink.line;
            continue;
        }
        fields.back().push_back(c);
    }

    if (inQuotes) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "line " + std::to_string(recordStart) + ": unterminated quoted field"});
    }
    if (auto error = sink.finish(fields, anyQuoted, recordStart)) {
        return std::unexpected(*error);
    }
    if (!sink.haveHeader) {
        return std::unexpected(Error{Error::Code::MalformedInput, "no header row"});
    }

    pt_log("Parsed " + std::to_string(table.rows.size()) + " rows with " + std::to_string(table.header.size())
                   + " columns",
           "CsvReader", "INFO");
    return table;
}

auto CsvReader::readFile(std::filesystem::path const& path, char delimiter) -> Expected<CsvTable> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open " + path.string()});
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed reading " + path.string()});
    }
    return parse(buffer.str(), delimiter);
}

} // namespace PT
