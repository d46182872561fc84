#include "dunetools/ron.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace dunetools::ron {

ParseError::ParseError(const std::string& message, size_t line, size_t column)
    : std::runtime_error("ron: line " + std::to_string(line) + ", column " +
                         std::to_string(column) + ": " + message),
      line_(line), column_(column) {}

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

std::string format_float(double v) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string sci(buf, ptr);
    if (!std::isfinite(v)) return sci;

    // Shortest digits as d.ddde+XX; decimal exponents -4..15 print fixed.
    const auto e = sci.find('e');
    int exp = 0;
    std::from_chars(sci.data() + e + (sci[e + 1] == '+' ? 2 : 1), sci.data() + sci.size(), exp);
    if (exp < -4 || exp >= 16) return sci;

    const auto mantissa = std::string_view(sci).substr(0, e);
    int digits = 0;
    for (char c : mantissa) digits += (c >= '0' && c <= '9') ? 1 : 0;
    const int precision = std::max(digits - 1 - exp, 0);

    auto [fptr, fec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed, precision);
    std::string s(buf, fptr);
    if (s.find('.') == std::string::npos) s += ".0";
    return s;
}

static std::string escape_string(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

static std::string vec3_body(const Vec3& v) {
    return format_float(v[0]) + ", " + format_float(v[1]) + ", " + format_float(v[2]);
}

static void write_vec3_list(std::ostream& w, const char* field,
                            const std::vector<Vec3>& list, int level) {
    const std::string indent(static_cast<size_t>(level), '\t');
    w << indent << field << ": [\n";
    for (const auto& v : list) w << indent << "\t(" << vec3_body(v) << "),\n";
    w << indent << "],\n";
}

static void write_sector(std::ostream& w, int32_t id, const board::Sector& sector, int level) {
    const std::string indent(static_cast<size_t>(level), '\t');
    w << indent << id << ": (\n";
    write_vec3_list(w, "vertices", sector.vertices, level + 1);
    w << indent << "\tindices: [";
    for (uint32_t i : sector.indices) w << i << ", ";
    w << "],\n";
    write_vec3_list(w, "fighters", sector.fighters, level + 1);
    w << indent << "),\n";
}

static void write_location(std::ostream& w, const board::Location& loc, int level) {
    const std::string indent(static_cast<size_t>(level), '\t');
    const std::string inner = indent + '\t';

    w << indent << "(\n";
    w << inner << "name: \"" << escape_string(loc.name) << "\",\n";
    w << inner << "terrain: " << board::terrain_name(loc.terrain) << ",\n";
    if (loc.spice)
        w << inner << "spice: Some((" << vec3_body(*loc.spice) << ")),\n";
    else
        w << inner << "spice: None,\n";
    w << inner << "sectors: {\n";
    for (const auto& [id, sector] : loc.sectors) write_sector(w, id, sector, level + 2);
    w << inner << "},\n";
    w << indent << "),\n";
}

void write(std::ostream& w, const board::LocationModel& model) {
    w << "[\n";
    for (const auto& [name, loc] : model) write_location(w, loc, 1);
    w << "]\n";
}

std::string to_string(const board::LocationModel& model) {
    std::ostringstream out;
    write(out, model);
    return out.str();
}

void write_file(const fs::path& path, const board::LocationModel& model) {
    const std::string text = to_string(model);

    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            const int err = errno != 0 ? errno : EIO;
            throw std::system_error(err, std::generic_category(), "ron: cannot create " + tmp.string());
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            const int err = errno != 0 ? errno : EIO;
            out.close();
            std::error_code rm_ec;
            fs::remove(tmp, rm_ec);
            throw std::system_error(err, std::generic_category(), "ron: cannot write " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw std::system_error(ec, "ron: cannot replace " + path.string());
    }
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

namespace {

struct Parser {
    std::string_view s;
    size_t pos = 0;

    [[noreturn]] void fail(const std::string& message) const {
        size_t line = 1;
        size_t column = 1;
        for (size_t i = 0; i < pos && i < s.size(); ++i) {
            if (s[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        throw ParseError(message, line, column);
    }

    void skip_ws() {
        while (pos < s.size()) {
            if (std::isspace(static_cast<unsigned char>(s[pos]))) {
                ++pos;
            } else if (s.substr(pos, 2) == "//") {
                auto nl = s.find('\n', pos);
                pos = nl == std::string_view::npos ? s.size() : nl + 1;
            } else if (s.substr(pos, 2) == "/*") {
                auto end = s.find("*/", pos + 2);
                if (end == std::string_view::npos) fail("unterminated block comment");
                pos = end + 2;
            } else {
                break;
            }
        }
    }

    bool match(char c) {
        skip_ws();
        if (pos < s.size() && s[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    }

    void expect(char c) {
        if (!match(c)) fail(std::string("expected '") + c + "'");
    }

    // Consumes a separating comma or requires the closing delimiter.
    bool end_of_entry(char close) {
        if (match(',')) return match(close);
        expect(close);
        return true;
    }

    std::string ident() {
        skip_ws();
        const size_t start = pos;
        while (pos < s.size() &&
               (std::isalnum(static_cast<unsigned char>(s[pos])) || s[pos] == '_')) {
            ++pos;
        }
        if (start == pos || std::isdigit(static_cast<unsigned char>(s[start]))) {
            pos = start;
            fail("expected identifier");
        }
        return std::string(s.substr(start, pos - start));
    }

    std::string string_lit() {
        expect('"');
        std::string out;
        while (pos < s.size() && s[pos] != '"') {
            char c = s[pos++];
            if (c == '\\') {
                if (pos >= s.size()) break;
                c = s[pos++];
                if (c == 'n') c = '\n';
                else if (c == 't') c = '\t';
                else if (c != '"' && c != '\\') fail(std::string("unsupported escape \\") + c);
            }
            out += c;
        }
        if (pos >= s.size()) fail("unterminated string");
        ++pos;
        return out;
    }

    std::string_view number_token() {
        skip_ws();
        const size_t start = pos;
        while (pos < s.size()) {
            const char c = s[pos];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+') ++pos;
            else break;
        }
        if (start == pos) fail("expected number");
        return s.substr(start, pos - start);
    }

    double real() {
        const size_t start = pos;
        auto tok = number_token();
        if (tok == "inf" || tok == "+inf") return std::numeric_limits<double>::infinity();
        if (tok == "-inf") return -std::numeric_limits<double>::infinity();
        if (tok == "nan" || tok == "NaN") return std::numeric_limits<double>::quiet_NaN();
        if (!tok.empty() && tok.front() == '+') tok.remove_prefix(1);
        double v = 0.0;
        auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
        if (ec != std::errc{} || ptr != tok.data() + tok.size()) {
            pos = start;
            fail("invalid number \"" + std::string(tok) + "\"");
        }
        return v;
    }

    template <typename Int>
    Int integer() {
        const size_t start = pos;
        auto tok = number_token();
        Int v = 0;
        auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
        if (ec != std::errc{} || ptr != tok.data() + tok.size()) {
            pos = start;
            fail("invalid integer \"" + std::string(tok) + "\"");
        }
        return v;
    }

    Vec3 vec3() {
        expect('(');
        Vec3 v{};
        v[0] = real();
        expect(',');
        v[1] = real();
        expect(',');
        v[2] = real();
        match(',');
        expect(')');
        return v;
    }

    std::vector<Vec3> vec3_list() {
        std::vector<Vec3> out;
        expect('[');
        if (match(']')) return out;
        while (true) {
            out.push_back(vec3());
            if (end_of_entry(']')) break;
        }
        return out;
    }

    std::vector<uint32_t> index_list() {
        std::vector<uint32_t> out;
        expect('[');
        if (match(']')) return out;
        while (true) {
            out.push_back(integer<uint32_t>());
            if (end_of_entry(']')) break;
        }
        return out;
    }

    // Optional struct name before '(' as the format allows ("Sector(...)").
    void open_struct() {
        skip_ws();
        if (pos < s.size() && (std::isalpha(static_cast<unsigned char>(s[pos])) || s[pos] == '_')) ident();
        expect('(');
    }

    board::Sector sector() {
        board::Sector out;
        bool seen_vertices = false;
        bool seen_indices = false;
        bool seen_fighters = false;

        open_struct();
        if (!match(')')) {
            while (true) {
                const auto key = ident();
                expect(':');
                if (key == "vertices" && !seen_vertices) {
                    out.vertices = vec3_list();
                    seen_vertices = true;
                } else if (key == "indices" && !seen_indices) {
                    out.indices = index_list();
                    seen_indices = true;
                } else if (key == "fighters" && !seen_fighters) {
                    out.fighters = vec3_list();
                    seen_fighters = true;
                } else {
                    fail("unexpected or repeated sector field \"" + key + "\"");
                }
                if (end_of_entry(')')) break;
            }
        }
        if (!seen_vertices || !seen_indices || !seen_fighters)
            fail("sector needs vertices, indices and fighters");
        return out;
    }

    board::SectorMap sector_map() {
        board::SectorMap out;
        expect('{');
        if (match('}')) return out;
        while (true) {
            const size_t at = pos;
            const auto id = integer<int32_t>();
            expect(':');
            if (out.find(id) != out.end()) {
                pos = at;
                fail("duplicate sector " + std::to_string(id));
            }
            out.emplace(id, sector());
            if (end_of_entry('}')) break;
        }
        return out;
    }

    std::optional<Vec3> spice() {
        const auto tag = ident();
        if (tag == "None") return std::nullopt;
        if (tag != "Some") fail("expected None or Some, got \"" + tag + "\"");
        expect('(');
        auto v = vec3();
        expect(')');
        return v;
    }

    board::Location location() {
        board::Location out;
        bool seen_name = false;
        bool seen_terrain = false;
        bool seen_spice = false;
        bool seen_sectors = false;

        open_struct();
        if (!match(')')) {
            while (true) {
                const auto key = ident();
                expect(':');
                if (key == "name" && !seen_name) {
                    out.name = string_lit();
                    seen_name = true;
                } else if (key == "terrain" && !seen_terrain) {
                    const auto t = ident();
                    auto terrain = board::parse_terrain(t);
                    if (!terrain) fail("unknown terrain \"" + t + "\"");
                    out.terrain = *terrain;
                    seen_terrain = true;
                } else if (key == "spice" && !seen_spice) {
                    out.spice = spice();
                    seen_spice = true;
                } else if (key == "sectors" && !seen_sectors) {
                    out.sectors = sector_map();
                    seen_sectors = true;
                } else {
                    fail("unexpected or repeated location field \"" + key + "\"");
                }
                if (end_of_entry(')')) break;
            }
        }
        if (!seen_name || !seen_terrain || !seen_spice || !seen_sectors)
            fail("location needs name, terrain, spice and sectors");
        return out;
    }

    board::LocationModel document() {
        board::LocationModel out;
        expect('[');
        if (!match(']')) {
            while (true) {
                const size_t at = pos;
                auto loc = location();
                if (out.find(loc.name) != out.end()) {
                    pos = at;
                    fail("duplicate location \"" + loc.name + "\"");
                }
                auto key = loc.name;
                out.emplace(key, std::move(loc));
                if (end_of_entry(']')) break;
            }
        }
        skip_ws();
        if (pos != s.size()) fail("trailing content after document");
        return out;
    }
};

} // namespace

board::LocationModel parse(std::string_view text) {
    Parser p{text};
    return p.document();
}

board::LocationModel read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        const int err = errno != 0 ? errno : ENOENT;
        throw std::system_error(err, std::generic_category(), "ron: cannot open " + path.string());
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    return parse(buf.str());
}

} // namespace dunetools::ron
