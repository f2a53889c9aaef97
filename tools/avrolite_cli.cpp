
#include "avrolite/avrolite.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static void usage() {
    std::cerr <<
        "avrolite (C++) - schema compiler, binary codec and container inspector\n"
        "\n"
        "Usage:\n"
        "  avrolite schema   <SCHEMA> [--namespace NS] [--no-color]\n"
        "  avrolite validate <SCHEMA> <VALUES> [--namespace NS] [--no-color]\n"
        "  avrolite encode   <SCHEMA> <VALUES> [--namespace NS]\n"
        "  avrolite decode   <SCHEMA> <HEX> [--lenient] [--namespace NS]\n"
        "  avrolite pack     <SCHEMA> <VALUES> <OUT> [--codec null|deflate] [--level N] [--namespace NS]\n"
        "  avrolite cat      <FILE> [--limit N]\n"
        "  avrolite header   <FILE> [--raw] [--no-color]\n"
        "  avrolite show     <FILE> [--limit N]\n"
        "\n"
        "SCHEMA is a schema file or inline schema JSON. VALUES is a file with one\n"
        "JSON value per line, or - for stdin. HEX is a hex string or a file of hex lines.\n";
}

struct Args {
    std::string cmd;
    std::vector<std::string> pos;
    std::string codec{"null"};
    int level{6};
    std::size_t limit{std::numeric_limits<std::size_t>::max()};
    bool raw{false};
    bool no_color{false};
    bool lenient{false};
    std::string name_space;
};

static std::size_t required_positionals(const std::string& cmd) {
    if (cmd == "schema" || cmd == "cat" || cmd == "header" || cmd == "show") return 1;
    if (cmd == "validate" || cmd == "encode" || cmd == "decode") return 2;
    if (cmd == "pack") return 3;
    return 0;
}

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];

    std::size_t want = required_positionals(a.cmd);
    if (want == 0) {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }

    int i = 2;
    while (i < argc) {
        std::string opt = argv[i++];
        if (opt.rfind("--", 0) != 0) {
            a.pos.push_back(opt);
            continue;
        }
        if (opt == "--raw") a.raw = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--lenient") a.lenient = true;
        else if (opt == "--codec" && i < argc) a.codec = argv[i++];
        else if (opt == "--level" && i < argc) a.level = std::stoi(argv[i++]);
        else if (opt == "--limit" && i < argc) a.limit = static_cast<std::size_t>(std::stoull(argv[i++]));
        else if (opt == "--namespace" && i < argc) a.name_space = argv[i++];
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.pos.size() != want) {
        std::cerr << a.cmd << " expects " << want << " argument(s)\n";
        return false;
    }
    return true;
}

// ----------------- Input helpers -----------------

static std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream is(p, std::ios::binary);
    if (!is) throw avrolite::AvroError(avrolite::ErrorKind::Io, "failed to open file: " + p.string());
    std::ostringstream oss;
    oss << is.rdbuf();
    return oss.str();
}

static avrolite::TypePtr load_schema(const std::string& arg, const Args& a, avrolite::Registry& registry) {
    std::error_code ec;
    std::string text = std::filesystem::is_regular_file(arg, ec) ? read_text_file(arg) : arg;

    avrolite::ParseOptions opts;
    opts.registry = &registry;
    opts.name_space = a.name_space;
    return avrolite::parse_schema(text, opts);
}

// Calls `fn(line_no, text)` for each non-blank line.
static void for_each_line(const std::string& source,
                          const std::function<void(std::size_t, const std::string&)>& fn) {
    std::ifstream file;
    std::istream* in = &std::cin;
    if (source != "-") {
        file.open(source, std::ios::binary);
        if (!file) throw avrolite::AvroError(avrolite::ErrorKind::Io, "failed to open file: " + source);
        in = &file;
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(*in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        fn(line_no, line);
    }
}

// Rethrows `e` with the input location in front of the message.
static avrolite::AvroError at_line(const avrolite::AvroError& e, const std::string& source, std::size_t line_no) {
    return avrolite::AvroError(e.kind(), source + ":" + std::to_string(line_no) + ": " + e.what());
}

static std::string to_hex(const std::vector<std::uint8_t>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

static std::vector<std::uint8_t> from_hex(const std::string& s) {
    auto nibble = [&](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw avrolite::AvroError(avrolite::ErrorKind::InvalidValue, "invalid hex string: " + s);
    };
    std::string digits;
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) digits.push_back(c);
    }
    if (digits.size() % 2 != 0) {
        throw avrolite::AvroError(avrolite::ErrorKind::InvalidValue, "odd-length hex string: " + s);
    }
    std::vector<std::uint8_t> out(digits.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<std::uint8_t>((nibble(digits[2 * i]) << 4) | nibble(digits[2 * i + 1]));
    }
    return out;
}

static std::string join_path(const avrolite::Path& path) {
    if (path.empty()) return "<root>";
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i) out += '.';
        out += path[i];
    }
    return out;
}

static std::string shorten(std::string s, std::size_t max) {
    if (s.size() > max) {
        s.resize(max > 3 ? max - 3 : max);
        s += "...";
    }
    return s;
}

// ----------------- Interactive UI tree (FTXUI) -----------------

struct UiNode {
    std::string name;
    std::string full_path; // dot-separated; empty for root
    std::vector<UiNode> children;
    const avrolite::Type* type{nullptr};
    const avrolite::Value* value{nullptr};
};

struct UiRow {
    const UiNode* node{nullptr};
    int depth{0};
    bool is_dir{false};
};

static UiNode ui_build(std::string name, std::string full_path,
                       const avrolite::Type& type, const avrolite::Value& value) {
    UiNode node;
    node.name = std::move(name);
    node.full_path = std::move(full_path);
    node.type = &type;
    node.value = &value;

    auto child_path = [&](const std::string& part) {
        return node.full_path.empty() ? part : node.full_path + "." + part;
    };

    if (const auto* rec = dynamic_cast<const avrolite::RecordType*>(&type)) {
        for (const auto& f : rec->fields()) {
            const avrolite::Value* member = value.find(f.name());
            if (!member) continue;
            node.children.push_back(ui_build(f.name(), child_path(f.name()), f.type(), *member));
        }
    } else if (const auto* arr = dynamic_cast<const avrolite::ArrayType*>(&type)) {
        if (value.is_array()) {
            const auto& items = value.as_array();
            for (std::size_t i = 0; i < items.size(); ++i) {
                std::string idx = std::to_string(i);
                node.children.push_back(ui_build("[" + idx + "]", child_path(idx), arr->items(), items[i]));
            }
        }
    }
    return node;
}

static void flatten_rows(const UiNode& node,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    // Root itself is not rendered; render its children.
    for (const auto& child : node.children) {
        bool is_dir = !child.children.empty();
        out.push_back(UiRow{&child, depth, is_dir});
        if (is_dir && expanded.find(child.full_path) != expanded.end()) {
            flatten_rows(child, expanded, depth + 1, out);
        }
    }
}

static std::string type_label(const avrolite::Type& t) {
    if (!t.name().empty()) return t.name();
    if (const auto* arr = dynamic_cast<const avrolite::ArrayType*>(&t)) {
        return "array<" + type_label(arr->items()) + ">";
    }
    return std::string(t.type_name());
}

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char ch : s) {
        if (ch == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

// Pretty JSON with keys and strings highlighted.
static ftxui::Element render_preview_colored(const std::string& preview) {
    using namespace ftxui;

    auto lines = split_lines(preview);
    if (lines.empty()) {
        return text("(no preview)") | color(Color::GrayDark);
    }

    std::vector<Element> els;
    els.reserve(lines.size());
    for (const auto& line : lines) {
        std::size_t lead = line.find_first_not_of(' ');
        if (lead == std::string::npos) lead = line.size();
        std::string indent = line.substr(0, lead);
        std::string rest = line.substr(lead);

        auto key_end = rest.find("\": ");
        if (!rest.empty() && rest.front() == '"' && key_end != std::string::npos) {
            els.push_back(hbox({
                text(indent),
                text(rest.substr(0, key_end + 1)) | bold | color(Color::Yellow),
                text(": ") | color(Color::GrayDark),
                text(rest.substr(key_end + 3)) | color(Color::Green) | flex,
            }));
            continue;
        }
        if (!rest.empty() && rest.front() == '"') {
            els.push_back(hbox({text(indent), text(rest) | color(Color::Green)}));
            continue;
        }
        els.push_back(text(line) | color(Color::White));
    }
    return vbox(std::move(els));
}

static const UiRow* safe_row_at(const std::vector<UiRow>& rows, int idx) {
    if (rows.empty()) return nullptr;
    if (idx < 0) return nullptr;
    if ((std::size_t)idx >= rows.size()) return nullptr;
    return &rows[(std::size_t)idx];
}

// ----------------- End UI tree helpers -----------------

static int run_show(const Args& a) {
    using namespace ftxui;

    const std::string& file = a.pos[0];
    avrolite::ContainerReader reader(file);
    const avrolite::Type& type = reader.type();

    // Values must stay put: the UI tree points into them.
    std::vector<avrolite::Value> values;
    std::size_t limit = a.limit == std::numeric_limits<std::size_t>::max() ? 1000 : a.limit;
    avrolite::Value v;
    while (values.size() < limit && reader.next(v)) values.push_back(std::move(v));
    bool more = reader.next(v);

    UiNode root;
    root.name = "<root>";
    for (std::size_t i = 0; i < values.size(); ++i) {
        std::string idx = std::to_string(i);
        root.children.push_back(ui_build("#" + idx, idx, type, values[i]));
    }

    std::set<std::string> expanded;
    int selected = 0;
    int left_scroll = 0;

    struct StatusKV {
        std::string k;
        std::string v;
    };
    std::vector<StatusKV> status_kv;
    std::string preview;
    std::string selected_path;

    auto rebuild = [&]() -> std::vector<UiRow> {
        std::vector<UiRow> out;
        flatten_rows(root, expanded, 0, out);
        if (out.empty()) {
            selected = 0;
        } else {
            if (selected < 0) selected = 0;
            if (selected >= (int)out.size()) selected = (int)out.size() - 1;
        }
        return out;
    };

    auto rows = rebuild();

    auto load_preview_for_selected = [&]() {
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr || !pr->node) return;
        const UiNode& n = *pr->node;
        selected_path = n.full_path;
        status_kv.clear();
        try {
            status_kv.push_back({"type", type_label(*n.type)});
            status_kv.push_back({"kind", std::string(n.type->type_name())});
            if (n.value->is_array()) {
                status_kv.push_back({"items", std::to_string(n.value->as_array().size())});
            }
            status_kv.push_back({"encoded", std::to_string(n.type->to_buffer(*n.value).size()) + " bytes"});
            preview = avrolite::dump_json_pretty(*n.value);
        } catch (const std::exception& e) {
            preview.clear();
            status_kv.push_back({"error", e.what()});
        }
    };

    load_preview_for_selected();

    auto left_pane = Renderer([&] {
        rows = rebuild();

        auto dim = ftxui::Terminal::Size();
        int term_h = std::max(10, dim.dimy);
        int visible_rows = std::max(3, term_h - 6);

        int total = (int)rows.size();
        if (total <= 0) {
            left_scroll = 0;
        } else {
            left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
            if (selected < left_scroll) left_scroll = selected;
            if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;
        }

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;
        constexpr int kLeftLineMax = 58;

        if (begin > 0) {
            items.push_back(text("↑ more") | color(Color::GrayDark));
        }
        for (int i = begin; i < end; ++i) {
            const UiRow& r = rows[(std::size_t)i];
            const UiNode* n = r.node;

            std::string glyph = "• ";
            if (r.is_dir) glyph = (expanded.find(n->full_path) != expanded.end()) ? "▾ " : "▸ ";
            std::string indent((std::size_t)r.depth * 2, ' ');

            std::string meta = r.is_dir ? type_label(*n->type)
                                        : shorten(avrolite::dump_json(*n->value), 24);

            Element line = hbox({
                text(indent + glyph + n->name) | color(Color::Cyan) | flex,
                text(meta) | color(Color::Yellow),
            }) | size(WIDTH, LESS_THAN, kLeftLineMax);
            if (i == selected) line = line | inverted;
            items.push_back(line);
        }
        if (end < total) {
            items.push_back(text("↓ more") | color(Color::GrayDark));
        }

        auto header = hbox({
            text("avro") | bold | color(Color::White),
            text("  "),
            text(file) | color(Color::GrayDark),
            text(more ? "  (truncated)" : "") | color(Color::Red),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("←→") | bold | color(Color::Yellow),
            text(" collapse/expand  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move  ") | color(Color::GrayDark),
            text("Enter") | bold | color(Color::Yellow),
            text(" preview") | color(Color::GrayDark),
        });

        return vbox({
                   header,
                   separator(),
                   vbox(std::move(items)) | flex,
               }) |
               flex |
               border;
    });

    auto right_pane = Renderer([&] {
        std::vector<Element> meta_lines;
        for (const auto& kv : status_kv) {
            meta_lines.push_back(hbox({
                text(kv.k) | bold | color(Color::Yellow),
                text(": ") | color(Color::GrayDark),
                text(kv.v) | color(Color::GrayLight) | flex,
            }));
        }
        if (meta_lines.empty()) {
            meta_lines.push_back(text("(no values)") | color(Color::GrayDark));
        }

        Element top = vbox({
            text(selected_path.empty() ? "<root>" : selected_path) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta_lines)) | flex,
        }) | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 10) | flex;

        Element body = vbox({
            text("value") | bold | color(Color::Magenta),
            separator(),
            render_preview_colored(preview) | flex,
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) | flex | border;
    });

    auto layout = Renderer([&] {
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);

        auto ui = hbox({
            left_pane->Render() | size(WIDTH, EQUAL, 60),
            right_pane->Render() | flex,
        }) | flex;

        return ui | size(WIDTH, EQUAL, term_w) | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        rows = rebuild();

        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr) return false;
        const UiRow& r = *pr;

        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected + 1 < (int)rows.size()) selected++;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min((int)rows.size() - 1, selected + 25);
            return true;
        }
        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min((int)rows.size() - 1, selected + 3);
                return true;
            }
        }
        if (e == Event::ArrowRight) {
            if (r.is_dir) {
                expanded.insert(r.node->full_path);
                rows = rebuild();
            }
            return true;
        }
        if (e == Event::ArrowLeft) {
            if (r.is_dir) {
                expanded.erase(r.node->full_path);
                rows = rebuild();
            }
            return true;
        }
        if (e == Event::Return) {
            load_preview_for_selected();
            return true;
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        if (a.cmd == "schema") {
            avrolite::Registry registry;
            auto type = load_schema(a.pos[0], a, registry);
            std::cout << avrolite::dump_json_pretty(type->schema()) << "\n";

            std::vector<std::string> named;
            for (const auto& n : registry.names()) {
                if (!avrolite::is_primitive(n)) named.push_back(n);
            }
            if (!named.empty()) {
                std::cout << ansi.bold() << "Named types" << ansi.reset() << ":\n";
                for (const auto& n : named) {
                    std::cout << "  " << ansi.cyan() << n << ansi.reset() << "\n";
                }
            }
            return 0;
        }

        if (a.cmd == "validate") {
            avrolite::Registry registry;
            auto type = load_schema(a.pos[0], a, registry);
            std::size_t total = 0;
            std::size_t invalid = 0;
            for_each_line(a.pos[1], [&](std::size_t line_no, const std::string& line) {
                avrolite::Value v;
                try {
                    v = avrolite::parse_json(line);
                } catch (const avrolite::AvroError& e) {
                    throw at_line(e, a.pos[1], line_no);
                }
                ++total;
                bool ok = type->is_valid(v, [&](const avrolite::Path& path, const avrolite::Value& val,
                                                const avrolite::Type& t) {
                    std::cout << ansi.red() << "invalid" << ansi.reset() << " line " << line_no << " at "
                              << ansi.bold() << join_path(path) << ansi.reset() << ": "
                              << shorten(avrolite::dump_json(val), 60) << ansi.dim() << " (expected "
                              << type_label(t) << ")" << ansi.reset() << "\n";
                });
                if (!ok) ++invalid;
            });
            std::cout << total << " value(s), ";
            if (invalid) std::cout << ansi.red() << invalid << " invalid" << ansi.reset() << "\n";
            else std::cout << ansi.green() << "all valid" << ansi.reset() << "\n";
            return invalid ? 3 : 0;
        }

        if (a.cmd == "encode") {
            avrolite::Registry registry;
            auto type = load_schema(a.pos[0], a, registry);
            avrolite::EncodeBuffer scratch;
            for_each_line(a.pos[1], [&](std::size_t line_no, const std::string& line) {
                try {
                    std::cout << to_hex(type->to_buffer(avrolite::parse_json(line), scratch)) << "\n";
                } catch (const avrolite::AvroError& e) {
                    throw at_line(e, a.pos[1], line_no);
                }
            });
            return 0;
        }

        if (a.cmd == "decode") {
            avrolite::Registry registry;
            auto type = load_schema(a.pos[0], a, registry);
            auto decode_one = [&](const std::string& hex) {
                avrolite::Value v = type->from_buffer(from_hex(hex), nullptr, a.lenient);
                std::cout << avrolite::dump_json(v) << "\n";
            };
            std::error_code ec;
            if (std::filesystem::is_regular_file(a.pos[1], ec)) {
                for_each_line(a.pos[1], [&](std::size_t line_no, const std::string& line) {
                    try {
                        decode_one(line);
                    } catch (const avrolite::AvroError& e) {
                        throw at_line(e, a.pos[1], line_no);
                    }
                });
            } else {
                decode_one(a.pos[1]);
            }
            return 0;
        }

        if (a.cmd == "pack") {
            avrolite::Registry registry;
            auto type = load_schema(a.pos[0], a, registry);
            avrolite::ContainerWriteOptions wo;
            wo.codec = avrolite::codec_from_string(a.codec);
            wo.deflate_level = a.level;

            avrolite::ContainerWriter writer(a.pos[2], type, wo);
            for_each_line(a.pos[1], [&](std::size_t line_no, const std::string& line) {
                try {
                    writer.append(avrolite::parse_json(line));
                } catch (const avrolite::AvroError& e) {
                    throw at_line(e, a.pos[1], line_no);
                }
            });
            writer.close();
            std::cerr << ansi.green() << "wrote" << ansi.reset() << " " << writer.count() << " value(s) to "
                      << a.pos[2] << " (" << a.codec << ", "
                      << std::filesystem::file_size(a.pos[2]) << " bytes)\n";
            return 0;
        }

        if (a.cmd == "cat") {
            avrolite::ContainerReader reader(a.pos[0]);
            avrolite::Value v;
            std::size_t n = 0;
            while (n < a.limit && reader.next(v)) {
                std::cout << avrolite::dump_json(v) << "\n";
                ++n;
            }
            return 0;
        }

        if (a.cmd == "header") {
            auto hdr = avrolite::read_container_header(a.pos[0]);
            std::vector<std::uint8_t> sync(hdr.sync.begin(), hdr.sync.end());

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.pos[0] << "\n";
            std::cout << ansi.bold() << "Codec" << ansi.reset() << ": " << avrolite::to_string(hdr.codec) << "\n";
            std::cout << ansi.bold() << "Sync" << ansi.reset() << ": " << to_hex(sync) << "\n";
            std::cout << ansi.bold() << "Data start" << ansi.reset() << ": " << hdr.data_start << "\n";
            std::cout << ansi.bold() << "File size" << ansi.reset() << ": "
                      << std::filesystem::file_size(a.pos[0]) << "\n";
            std::cout << ansi.bold() << "Metadata" << ansi.reset() << ":\n";
            for (const auto& kv : hdr.metadata) {
                std::cout << "  " << ansi.yellow() << kv.first << ansi.reset() << ansi.dim() << " ("
                          << kv.second.size() << " bytes)" << ansi.reset() << "\n";
            }

            if (a.raw) {
                std::cout << hdr.schema_json << "\n";
            } else {
                std::cout << ansi.dim() << "(use --raw to print the embedded schema)\n" << ansi.reset();
            }
            return 0;
        }

        if (a.cmd == "show") {
            return run_show(a);
        }

    } catch (const avrolite::AvroError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " [" << avrolite::to_string(e.kind()) << "]: "
                  << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
