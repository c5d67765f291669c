#pragma once
#include <map>
#include <sstream>
#include <string>

// Keeps the text of a script so diagnostics can quote the offending line.
// The parser owns one per file and hands a pointer to every TokenLocation it creates;
// it must outlive any error rendered from those locations.
class SourceManager {
   public:
    std::string filename;
    std::string source;
    std::map<int, std::string> lines;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        build_line_map();
    }

    std::string get_line(int line_num) const {
        auto it = lines.find(line_num);
        return it != lines.end() ? it->second : "";
    }

    // " * 12 |     assert fib(10) == 56;"
    // "                  ^^^^^^^^^^^^^^"
    std::string format_error_context(int line, int col, int length = 1) const {
        std::stringstream ss;
        std::string gutter = " * " + std::to_string(line) + " | ";
        std::string line_text = get_line(line);
        ss << gutter << line_text << "\n";
        int pad = static_cast<int>(gutter.size()) + (col > 0 ? col - 1 : 0);
        ss << std::string(pad, ' ') << std::string(length > 1 ? length : 1, '^');
        return ss.str();
    }

   private:
    void build_line_map() {
        int line_num = 1;
        std::string current_line;

        for (char c : source) {
            if (c == '\r') continue;
            if (c == '\n') {
                lines[line_num] = current_line;
                current_line.clear();
                line_num++;
            } else {
                current_line += c;
            }
        }
        if (!current_line.empty()) {
            lines[line_num] = current_line;
        }
    }
};
