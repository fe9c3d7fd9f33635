#include <utility.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <limits>
#include <csignal>
#include <sys/stat.h>

namespace utility {

// ----------------------------------------------------------------------------
// random Class Implementation
// ----------------------------------------------------------------------------

random random::stream(unsigned int seed, unsigned int index) {
    std::seed_seq seq{seed, index};
    random rng;
    rng.generator_.seed(seq);
    return rng;
}

void random::set_seed(unsigned int seed) {
    generator_.seed(seed);
    normal_.reset();
}

double random::normal() {
    return normal_(generator_);
}

// ----------------------------------------------------------------------------
// parameters Class Implementation
// ----------------------------------------------------------------------------

namespace { // Anonymous namespace for private helper functions

    // Helper to trim whitespace from both ends of a string
    void trim(std::string& str) {
        str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
            return !std::isspace(ch);
        }));
        str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
            return !std::isspace(ch);
        }).base(), str.end());
    }

    // '#' starts a comment anywhere, ';' only at the beginning of a line
    // (';' separates matrix rows inside values)
    void removeComment(std::string& str) {
        size_t comment_pos = str.find('#');
        if (comment_pos != std::string::npos) {
            str = str.substr(0, comment_pos);
        }
        size_t first = str.find_first_not_of(" \t");
        if (first != std::string::npos && str[first] == ';') {
            str.clear();
        }
    }

    // Handle underscores in numbers (e.g., 10_000 -> 10000)
    std::string clean_number(std::string value) {
        value.erase(std::remove(value.begin(), value.end(), '_'), value.end());
        return value;
    }

    std::vector<std::string> split(const std::string& str, char delim) {
        std::vector<std::string> items;
        std::stringstream ss(str);
        std::string item;
        while (std::getline(ss, item, delim)) {
            trim(item);
            if (item.empty()) continue;
            items.push_back(item);
        }
        return items;
    }

    double to_double(const std::string& item, const std::string& key) {
        try {
            size_t used = 0;
            std::string clean = clean_number(item);
            double value = std::stod(clean, &used);
            if (used != clean.size()) throw std::invalid_argument(item);
            return value;
        } catch (const std::exception&) {
            throw ConfigurationError("Cannot convert '" + item + "' to double for key '" + key + "'");
        }
    }

    int to_int(const std::string& item, const std::string& key) {
        try {
            size_t used = 0;
            std::string clean = clean_number(item);
            int value = std::stoi(clean, &used);
            if (used != clean.size()) throw std::invalid_argument(item);
            return value;
        } catch (const std::exception&) {
            throw ConfigurationError("Cannot convert '" + item + "' to integer for key '" + key + "'");
        }
    }

    unsigned int to_unsigned(const std::string& item, const std::string& key) {
        try {
            size_t used = 0;
            std::string clean = clean_number(item);
            if (!clean.empty() && clean.front() == '-') throw std::invalid_argument(item);
            unsigned long value = std::stoul(clean, &used);
            if (used != clean.size()) throw std::invalid_argument(item);
            if (value > std::numeric_limits<unsigned int>::max()) throw std::out_of_range(item);
            return static_cast<unsigned int>(value);
        } catch (const std::exception&) {
            throw ConfigurationError("Cannot convert '" + item + "' to unsigned integer for key '" + key + "'");
        }
    }

} // end anonymous namespace

void parameters::parseLine(const std::string& line, std::string& current_section) {
    std::string trimmed_line = line;
    removeComment(trimmed_line);
    trim(trimmed_line);

    if (trimmed_line.empty()) {
        return;
    }

    if (trimmed_line.front() == '[' && trimmed_line.back() == ']') {
        current_section = trimmed_line.substr(1, trimmed_line.length() - 2);
        trim(current_section);
        return;
    }

    size_t equal_pos = trimmed_line.find('=');
    if (equal_pos != std::string::npos) {
        std::string key = trimmed_line.substr(0, equal_pos);
        std::string value = trimmed_line.substr(equal_pos + 1);

        trim(key);
        trim(value);

        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                  (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        sections[current_section][key] = value;
    }
}

parameters::parameters(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open parameter file: " + filename);
    }

    std::string line;
    std::string current_section = "global";

    while (std::getline(file, line)) {
        parseLine(line, current_section);
    }

    file.close();
}

void parameters::set(const std::string& section, const std::string& key, const std::string& value) {
    sections[section][key] = value;
}

std::string parameters::getString(const std::string& section, const std::string& key) const {
    auto section_it = sections.find(section);
    if (section_it == sections.end()) {
        throw ConfigurationError("Section '" + section + "' not found");
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        throw ConfigurationError("Key '" + key + "' not found in section '" + section + "'");
    }

    return key_it->second;
}

// Defaults apply only to absent keys; a present but malformed value still throws.
std::string parameters::getString(const std::string& section, const std::string& key, const std::string& default_value) const {
    if (!hasKey(section, key)) return default_value;
    return getString(section, key);
}

int parameters::getInt(const std::string& section, const std::string& key) const {
    return to_int(getString(section, key), key);
}

int parameters::getInt(const std::string& section, const std::string& key, int default_value) const {
    if (!hasKey(section, key)) return default_value;
    return getInt(section, key);
}

unsigned int parameters::getUnsigned(const std::string& section, const std::string& key) const {
    return to_unsigned(getString(section, key), key);
}

unsigned int parameters::getUnsigned(const std::string& section, const std::string& key, unsigned int default_value) const {
    if (!hasKey(section, key)) return default_value;
    return getUnsigned(section, key);
}

double parameters::getDouble(const std::string& section, const std::string& key) const {
    return to_double(getString(section, key), key);
}

double parameters::getDouble(const std::string& section, const std::string& key, double default_value) const {
    if (!hasKey(section, key)) return default_value;
    return getDouble(section, key);
}

bool parameters::getBool(const std::string& section, const std::string& key) const {
    std::string value = getString(section, key);
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    } else if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    } else {
        throw ConfigurationError("Cannot convert '" + value + "' to boolean for key '" + key + "'");
    }
}

bool parameters::getBool(const std::string& section, const std::string& key, bool default_value) const {
    if (!hasKey(section, key)) return default_value;
    return getBool(section, key);
}

std::vector<double> parameters::getDoubleVector(const std::string& section, const std::string& key) const {
    std::vector<double> result;
    for (const auto& item : split(getString(section, key), ',')) {
        result.push_back(to_double(item, key));
    }
    return result;
}

std::vector<int> parameters::getIntVector(const std::string& section, const std::string& key) const {
    std::vector<int> result;
    for (const auto& item : split(getString(section, key), ',')) {
        result.push_back(to_int(item, key));
    }
    return result;
}

arma::mat parameters::getMatrix(const std::string& section, const std::string& key) const {
    std::vector<std::string> rows = split(getString(section, key), ';');
    if (rows.empty()) {
        throw ConfigurationError("Matrix for key '" + key + "' is empty");
    }

    std::vector<std::vector<double>> values;
    for (const auto& row : rows) {
        std::vector<double> parsed;
        for (const auto& item : split(row, ',')) {
            parsed.push_back(to_double(item, key));
        }
        if (!values.empty() && parsed.size() != values.front().size()) {
            throw ConfigurationError("Ragged matrix rows for key '" + key + "'");
        }
        values.push_back(parsed);
    }

    arma::mat M(values.size(), values.front().size());
    for (arma::uword i = 0; i < M.n_rows; ++i) {
        for (arma::uword j = 0; j < M.n_cols; ++j) {
            M(i, j) = values[i][j];
        }
    }
    return M;
}

bool parameters::hasSection(const std::string& section) const {
    return sections.count(section) > 0;
}

bool parameters::hasKey(const std::string& section, const std::string& key) const {
    auto section_it = sections.find(section);
    if (section_it == sections.end()) {
        return false;
    }
    return section_it->second.count(key) > 0;
}


// ----------------------------------------------------------------------------
// io
// ----------------------------------------------------------------------------

bool io::ensure_dir(const std::string& path) {
    struct stat info;
    if (stat(path.c_str(), &info) == 0) {
        return S_ISDIR(info.st_mode);
    }
    return mkdir(path.c_str(), 0755) == 0;
}


// ----------------------------------------------------------------------------
// interrupt
// ----------------------------------------------------------------------------

namespace interrupt {

namespace {
    volatile std::sig_atomic_t flag = 0;

    void on_signal(int) {
        flag = 1;
    }
}

void install() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

bool requested() noexcept { return flag != 0; }

void request() noexcept { flag = 1; }

void reset() noexcept { flag = 0; }

} // namespace interrupt

} // namespace utility
