#include <cctype>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "extractor.hpp"


static volatile std::sig_atomic_t g_stop = 0;

extern "C" void on_sigint(int) {
    g_stop = 1;
}

static inline std::string trim_copy(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace((unsigned char)s[a])) ++a;
    while (b > a && std::isspace((unsigned char)s[b - 1])) --b;
    return s.substr(a, b - a);
}

static void usage(const char* prog) {
    std::cerr << "usage: " << prog << " [-d C] [-i] [FILE...]\n"
              << "  -d C  delimiter character (default ')\n"
              << "  -i    interactive: one text per line, !q to quit\n";
}

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Cannot open file: " + path);
    return read_all(f);
}

static void print_strings(const std::vector<std::string>& strs, char delimiter) {
    for (const auto& s : strs) {
        std::cout << quote_literal(s, delimiter) << '\n';
    }
}

// one text per line until !q, EOF or Ctrl-C
static void terminal(char delimiter) {
    std::signal(SIGINT, on_sigint);

    for (;;) {
        if (g_stop) return;

        std::string line;
        if (!std::getline(std::cin, line)) return;

        if (trim_copy(line) == "!q") return;

        std::vector<std::string> strs;
        std::string err;

        if (!try_extract_strings(line, strs, err, delimiter)) {
            std::cout << "[ERROR] " << err << "\n";
            continue;
        }

        std::cout << "[INFO]: " << strs.size() << " string(s)\n";
        print_strings(strs, delimiter);
    }
}


int main(int argc, char** argv) {
    char delimiter = DEFAULT_DELIMITER;
    bool interactive = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-i") {
            interactive = true;
        } else if (arg == "-d") {
            if (i + 1 >= argc || std::strlen(argv[i + 1]) != 1) {
                std::cerr << "error: -d expects exactly one character\n";
                usage(argv[0]);
                return 2;
            }
            delimiter = argv[++i][0];
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "error: unknown option " << arg << "\n";
            usage(argv[0]);
            return 2;
        } else {
            files.push_back(arg);
        }
    }

    if (interactive && !files.empty()) {
        std::cerr << "error: -i reads standard input, no files expected\n";
        return 2;
    }

    try {
        if (interactive) {
            terminal(delimiter);
            return 0;
        }

        if (files.empty()) {
            print_strings(extract_strings(read_all(std::cin), delimiter), delimiter);
            return 0;
        }

        for (const auto& path : files) {
            std::string text = (path == "-") ? read_all(std::cin) : read_file(path);
            std::vector<std::string> strs = extract_strings(std::move(text), delimiter);
            if (files.size() > 1) std::cout << "==> " << path << " <==\n";
            print_strings(strs, delimiter);
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
