
#include "nbt/nbt.hpp"
#include "nbt/nbt_easy.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <locale>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <set>

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
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
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
        "nbt (C++) - NBT inspector\n"
        "\n"
        "Usage:\n"
        "  nbt info <FILE> [--network] [--max-depth N] [--no-color]\n"
        "  nbt tree <FILE> [--prefix <PATH>] [--levels N] [--network] [--max-depth N] [--no-color]\n"
        "  nbt show <FILE> [<PATH>] [--max-elems N] [--network] [--max-depth N] [--no-color]\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string path;
    bool no_color{false};
    std::string prefix;
    std::size_t levels{static_cast<std::size_t>(-1)};
    std::size_t max_elems{20};
    nbt::ParseOptions parse{};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    // positional path for show
    if (a.cmd == "show" && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.path = argv[i++];
    }

    try {
        while (i < argc) {
            std::string opt = argv[i++];
            if (opt == "--no-color") a.no_color = true;
            else if (opt == "--network") a.parse.named_root = false;
            else if (opt == "--prefix" && i < argc) a.prefix = argv[i++];
            else if (opt == "--levels" && i < argc) a.levels = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--max-elems" && i < argc) a.max_elems = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--max-depth" && i < argc) a.parse.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
            else {
                std::cerr << "Unknown option: " << opt << "\n";
                return false;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Invalid numeric option value\n";
        return false;
    }

    if (a.cmd != "info" && a.cmd != "tree" && a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

// ----------------- Tag formatting -----------------

static std::string quoted(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

// Short type label, e.g. "Int", "List<Compound>[3]", "IntArray[4]".
static std::string type_label(const nbt::Tag& t) {
    std::ostringstream oss;
    oss << nbt::to_string(t.type());
    switch (t.type()) {
        case nbt::TagType::List:
            oss << '<' << nbt::to_string(t.as_list().element_type()) << ">[" << t.as_list().size() << ']';
            break;
        case nbt::TagType::Compound: oss << '[' << t.as_compound().size() << ']'; break;
        case nbt::TagType::ByteArray: oss << '[' << t.as_byte_array().size() << ']'; break;
        case nbt::TagType::IntArray: oss << '[' << t.as_int_array().size() << ']'; break;
        case nbt::TagType::LongArray: oss << '[' << t.as_long_array().size() << ']'; break;
        default: break;
    }
    return oss.str();
}

// Scalar value as text; empty for containers and arrays.
static std::string scalar_text(const nbt::Tag& t) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    switch (t.type()) {
        case nbt::TagType::Byte: oss << static_cast<int>(t.as_byte()); break;
        case nbt::TagType::Short: oss << t.as_short(); break;
        case nbt::TagType::Int: oss << t.as_int(); break;
        case nbt::TagType::Long: oss << t.as_long(); break;
        case nbt::TagType::Float: oss << std::setprecision(9) << t.as_float(); break;
        case nbt::TagType::Double: oss << std::setprecision(17) << t.as_double(); break;
        case nbt::TagType::String: oss << quoted(t.as_string()); break;
        default: break;
    }
    return oss.str();
}

template <typename Array>
static void print_array_preview(const Array& a, std::size_t max_elems) {
    std::size_t show = std::min(max_elems, a.size());
    std::cout << "preview:\n";
    std::cout << "  first " << show << ":\n";
    std::cout << "  ";
    for (std::size_t i = 0; i < show; ++i) {
        std::cout << static_cast<long long>(a[i]) << " ";
    }
    std::cout << "\n";
}

static void print_tag_preview(const nbt::Tag& t, std::size_t max_elems) {
    switch (t.type()) {
        case nbt::TagType::Compound: {
            const auto& c = t.as_compound();
            std::cout << "compound:\n";
            std::cout << "  entries=" << c.size() << "\n";
            std::cout << "preview:\n";
            for (const auto& kv : c) {
                std::cout << "  " << kv.first << "=" << type_label(kv.second);
                std::string s = scalar_text(kv.second);
                if (!s.empty()) std::cout << " " << s;
                std::cout << "\n";
            }
            return;
        }
        case nbt::TagType::List: {
            const auto& l = t.as_list();
            std::cout << "list:\n";
            std::cout << "  element_type=" << nbt::to_string(l.element_type()) << "\n";
            std::cout << "  size=" << l.size() << "\n";
            std::cout << "preview:\n";
            std::size_t show = std::min(max_elems, l.size());
            for (std::size_t i = 0; i < show; ++i) {
                std::cout << "  [" << i << "] " << type_label(l[i]);
                std::string s = scalar_text(l[i]);
                if (!s.empty()) std::cout << " " << s;
                std::cout << "\n";
            }
            return;
        }
        case nbt::TagType::ByteArray: {
            const auto& a = t.as_byte_array();
            std::cout << "byte array:\n";
            std::cout << "  size=" << a.size() << "\n";
            print_array_preview(a, max_elems);
            return;
        }
        case nbt::TagType::IntArray: {
            const auto& a = t.as_int_array();
            std::cout << "int array:\n";
            std::cout << "  size=" << a.size() << "\n";
            print_array_preview(a, max_elems);
            return;
        }
        case nbt::TagType::LongArray: {
            const auto& a = t.as_long_array();
            std::cout << "long array:\n";
            std::cout << "  size=" << a.size() << "\n";
            print_array_preview(a, max_elems);
            return;
        }
        case nbt::TagType::String:
            std::cout << "string:\n";
            std::cout << "  bytes=" << t.as_string().size() << "\n";
            std::cout << "preview:\n";
            std::cout << "  " << quoted(t.as_string()) << "\n";
            return;
        case nbt::TagType::End:
            std::cout << "end\n";
            return;
        default:
            std::cout << nbt::to_string(t.type()) << ": " << scalar_text(t) << "\n";
            return;
    }
}

// ----------------- Tree printer -----------------

static void print_tree(
    const nbt::Tag& node,
    const Ansi& ansi,
    std::size_t indent,
    std::size_t depth,
    std::size_t max_levels
) {
    if (depth >= max_levels) return;

    auto print_entry = [&](const std::string& name, const nbt::Tag& child) {
        std::string pad(indent, ' ');
        bool is_dir = child.is_compound() || child.is_list();
        std::cout << pad
                  << (is_dir ? ansi.magenta() : ansi.cyan()) << name << (is_dir ? "/" : "") << ansi.reset()
                  << " " << ansi.yellow() << type_label(child) << ansi.reset();
        std::string s = scalar_text(child);
        if (!s.empty()) std::cout << " " << ansi.green() << s << ansi.reset();
        std::cout << "\n";
        if (is_dir) print_tree(child, ansi, indent + 2, depth + 1, max_levels);
    };

    if (node.is_compound()) {
        for (const auto& kv : node.as_compound()) {
            print_entry(std::string(kv.first), kv.second);
        }
    } else if (node.is_list()) {
        const auto& l = node.as_list();
        for (std::size_t i = 0; i < l.size(); ++i) {
            print_entry("[" + std::to_string(i) + "]", l[i]);
        }
    }
}

// ----------------- Interactive UI tree (FTXUI) -----------------

struct UiNode {
    std::string name;
    std::string full_path; // dot-separated; empty for root
    std::vector<UiNode> children;
    const nbt::Tag* tag{nullptr};
};

struct UiRow {
    const UiNode* node{nullptr};
    int depth{0};
    bool is_dir{false};
};

static void ui_build(UiNode& node) {
    auto add = [&](std::string segment, std::string label, const nbt::Tag& child) {
        UiNode n;
        n.name = std::move(label);
        n.full_path = node.full_path.empty() ? segment : node.full_path + "." + segment;
        n.tag = &child;
        ui_build(n);
        node.children.push_back(std::move(n));
    };

    if (node.tag->is_compound()) {
        for (const auto& kv : node.tag->as_compound()) {
            add(std::string(kv.first), std::string(kv.first), kv.second);
        }
    } else if (node.tag->is_list()) {
        const auto& l = node.tag->as_list();
        for (std::size_t i = 0; i < l.size(); ++i) {
            add(std::to_string(i), "[" + std::to_string(i) + "]", l[i]);
        }
    }
}

static const UiNode* ui_find(const UiNode& root, const std::string& path) {
    if (root.full_path == path) return &root;
    for (const auto& c : root.children) {
        if (path == c.full_path || path.rfind(c.full_path + ".", 0) == 0) {
            return ui_find(c, path);
        }
    }
    return nullptr;
}

static void flatten_rows(const UiNode& node,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    // Root itself is not rendered; render its children.
    for (const auto& child : node.children) {
        bool is_dir = child.tag->is_compound() || child.tag->is_list();
        out.push_back(UiRow{&child, depth, is_dir});

        if (is_dir && expanded.find(child.full_path) != expanded.end()) {
            flatten_rows(child, expanded, depth + 1, out);
        }
    }
}

static std::string preview_to_string(const nbt::Tag& t, std::size_t max_elems) {
    std::ostringstream oss;
    std::streambuf* old = std::cout.rdbuf(oss.rdbuf());
    // Reuse the existing preview printer to keep behavior consistent with non-TUI output.
    print_tag_preview(t, max_elems);
    std::cout.rdbuf(old);
    return oss.str();
}

// --- Preview rendering helpers for FTXUI ---
static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    cur.reserve(128);
    for (char ch : s) {
        if (ch == '\r') continue;
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

static ftxui::Element render_preview_colored(const std::string& preview) {
    using namespace ftxui;

    auto lines = split_lines(preview);
    if (lines.empty()) {
        return text("(no preview)") | color(Color::GrayDark);
    }

    std::vector<Element> els;
    els.reserve(lines.size());

    for (const auto& line : lines) {
        if (line.empty()) {
            els.push_back(text(""));
            continue;
        }

        // Section headers like "compound:" / "preview:".
        if (line.back() == ':' && line.size() < 40 && line.rfind("  ", 0) != 0) {
            els.push_back(text(line) | bold | color(Color::Magenta));
            continue;
        }

        if (line.rfind("  ", 0) == 0) {
            std::string rest = line.substr(2);

            if (!rest.empty() && rest.front() == '"') {
                els.push_back(hbox({
                    text("  "),
                    text(rest) | color(Color::Green),
                }));
                continue;
            }

            auto eq = rest.find('=');
            if (eq != std::string::npos) {
                std::string k = rest.substr(0, eq);
                std::string v = rest.substr(eq + 1);
                els.push_back(hbox({
                    text("  "),
                    text(k) | bold | color(Color::Yellow),
                    text("=") | color(Color::GrayDark),
                    text(v) | color(Color::GrayLight) | flex,
                }));
                continue;
            }

            els.push_back(text(line) | color(Color::White));
            continue;
        }

        // One-liners like "Int: 42".
        auto colon = line.find(':');
        if (colon != std::string::npos && colon < 32) {
            els.push_back(hbox({
                text(line.substr(0, colon + 1)) | bold | color(Color::Magenta),
                text(line.substr(colon + 1)) | color(Color::White) | flex,
            }));
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

static int run_browser(const Args& a, const nbt::Document& doc) {
    UiNode root;
    root.name = "<root>";
    root.tag = &doc.root();
    ui_build(root);

    const UiNode* start = &root;
    if (!a.path.empty() && a.path != "<root>") {
        start = ui_find(root, a.path);
        if (!start) {
            std::cerr << "Error: path not found: " << a.path << "\n";
            return 2;
        }
    }

    using namespace ftxui;

    std::set<std::string> expanded;
    int selected = 0;
    int left_scroll = 0; // first visible row index in left pane

    struct StatusKV {
        std::string k;
        std::string v;
    };
    std::vector<StatusKV> status_kv;

    std::string preview;
    std::string selected_path;

    auto rebuild = [&]() -> std::vector<UiRow> {
        std::vector<UiRow> out;
        flatten_rows(*start, expanded, 0, out);
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
        preview = preview_to_string(*n.tag, a.max_elems);

        status_kv.clear();
        status_kv.push_back({"type", nbt::to_string(n.tag->type())});
        status_kv.push_back({"label", type_label(*n.tag)});
        std::string s = scalar_text(*n.tag);
        if (!s.empty()) status_kv.push_back({"value", s});
    };

    load_preview_for_selected();

    auto left_pane = Renderer([&] {
        rows = rebuild();

        // The left pane scrolls inside its own viewport.
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
            left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
        }

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;
        items.reserve((std::size_t)std::max(0, end - begin) + 2);

        constexpr int kLeftLineMax = 58; // pane width is 60, leave room for borders

        if (begin > 0) {
            items.push_back(text("↑ more") | color(Color::GrayDark));
        }

        for (int i = begin; i < end; ++i) {
            const UiRow& r = rows[(std::size_t)i];
            const UiNode* n = r.node;

            std::string glyph = "• ";
            if (r.is_dir) glyph = (expanded.find(n->full_path) != expanded.end()) ? "▾ " : "▸ ";

            std::string indent((std::size_t)r.depth * 2, ' ');

            Element left_txt = text(indent + glyph + n->name) | color(Color::Cyan) | flex;
            Element right_txt = text(type_label(*n->tag)) | color(Color::Yellow);
            Element line = hbox({ left_txt, right_txt }) | size(WIDTH, LESS_THAN, kLeftLineMax);

            if (i == selected) {
                line = line | inverted;
            }
            items.push_back(line);
        }

        if (end < total) {
            items.push_back(text("↓ more") | color(Color::GrayDark));
        }

        auto header = hbox({
            text("NBT") | bold | color(Color::White),
            text("  "),
            text(a.file) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("←→") | bold | color(Color::Yellow),
            text(" collapse/expand  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move  ") | color(Color::GrayDark),
            text("Enter") | bold | color(Color::Yellow),
            text(" preview") | color(Color::GrayDark)
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
        meta_lines.reserve(status_kv.size() + 1);
        for (const auto& kv : status_kv) {
            meta_lines.push_back(
                hbox({
                    text(kv.k) | bold | color(Color::Yellow),
                    text(": ") | color(Color::GrayDark),
                    text(kv.v) | color(Color::GrayLight) | flex,
                })
            );
        }
        if (meta_lines.empty()) {
            meta_lines.push_back(text("(no metadata)") | color(Color::GrayDark));
        }

        Element top = vbox({
            text(selected_path.empty() ? "<root>" : selected_path) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta_lines)) | flex,
        }) | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 10) | flex;

        Element body = vbox({
            text("preview") | bold | color(Color::Magenta),
            separator(),
            render_preview_colored(preview) | flex,
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) |
               flex |
               border;
    });

    auto layout = Renderer([&] {
        int left_w = 60;
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);

        auto ui = hbox({
            left_pane->Render() | size(WIDTH, EQUAL, left_w),
            right_pane->Render() | flex,
        }) | flex;

        return ui
            | size(WIDTH, EQUAL, term_w)
            | size(HEIGHT, EQUAL, term_h);
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
        nbt::Document doc = nbt::Document::read_file(a.file, a.parse);

        if (a.cmd == "info") {
            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "Compression" << ansi.reset() << ": "
                      << (doc.was_compressed() ? "gzip" : "none") << "\n";
            std::cout << ansi.bold() << "Decoded size" << ansi.reset() << ": " << doc.bytes().size() << " bytes\n";
            std::cout << ansi.bold() << "Root name" << ansi.reset() << ": " << quoted(doc.name()) << "\n";
            std::cout << ansi.bold() << "Root entries" << ansi.reset() << ": " << doc.compound().size() << "\n";
            return 0;
        }

        if (a.cmd == "tree") {
            const nbt::Tag* node = &doc.root();
            if (!a.prefix.empty()) {
                node = nbt::easy::find(doc.compound(), a.prefix);
                if (!node) {
                    std::cerr << "prefix not found: " << a.prefix << "\n";
                    return 2;
                }
                std::cout << ansi.dim() << "prefix: " << a.prefix << ansi.reset() << "\n";
            }

            std::cout << ansi.bold() << "NBT tree" << ansi.reset() << ": " << a.file
                      << " " << ansi.dim() << quoted(doc.name()) << ansi.reset() << "\n";
            if (!node->is_compound() && !node->is_list()) {
                print_tag_preview(*node, a.max_elems);
                return 0;
            }
            print_tree(*node, ansi, 0, 0, a.levels);
            return 0;
        }

        if (a.cmd == "show") {
            return run_browser(a, doc);
        }

    } catch (const nbt::NbtError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " [" << nbt::to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
