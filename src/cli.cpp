#include "cli.hpp"
#include "word_filter.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <stdexcept>

static std::string trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto b = std::find_if_not(s.begin(), s.end(), is_space);
    auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return b < e ? std::string(b, e) : std::string();
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static int usage(std::ostream& err) {
    err << "usage: petal build <wordlist> <image>\n"
        << "       petal check <image> <word>...\n";
    return 2;
}

static int build(const std::string& wordlist, const std::string& image, std::ostream& out) {
    std::ifstream in(wordlist);
    if (!in.is_open()) throw std::runtime_error("Failed to open word list: " + wordlist);

    ProbabilisticSet words = make_word_filter();
    uint64_t count = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string word = trim(line); // also drops '\r'
        if (word.empty()) continue;
        words.insert(word);
        count++;
    }

    words.save(image);
    out << "corpus words: " << count << "\n";
    return 0;
}

static int check(const std::string& image,
                 std::vector<std::string>::const_iterator first,
                 std::vector<std::string>::const_iterator last,
                 std::ostream& out) {
    ProbabilisticSet words = make_word_filter();
    words.load(image);

    for (; first != last; ++first) {
        const std::string word = lowercase(*first);
        out << word << ": "
            << (words.contains(word) ? "yes" : "no")
            << " (confidence " << words.confidence(word) << ")\n";
    }
    return 0;
}

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.empty()) return usage(err);
    const std::string& cmd = args[0];

    try {
        if (cmd == "build" && args.size() == 3) return build(args[1], args[2], out);
        if (cmd == "check" && args.size() >= 3) return check(args[1], args.begin() + 2, args.end(), out);
    } catch (const std::exception& e) {
        err << "petal: " << e.what() << "\n";
        return 1;
    }

    return usage(err);
}
