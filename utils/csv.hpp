#pragma once
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    // Minimal CSV reader with:
    // - header → column index
    // - quoted fields
    // - comment / blank skipping
    // - typed helpers (double / nullable double)
    class CsvReader
    {
    public:
        CsvReader() = default;

        bool open(const std::string &path)
        {
            file_.open(path);
            if (!file_.is_open())
                return false;

            header_.clear();
            col_index_.clear();

            std::string line;
            while (std::getline(file_, line))
            {
                if (is_blank(line) || line[0] == '#')
                    continue;

                strip_cr(line);
                header_ = parse_line(line);
                for (size_t i = 0; i < header_.size(); ++i)
                {
                    trim_inplace(header_[i]);
                    col_index_[header_[i]] = static_cast<int>(i);
                }
                return true;
            }
            return false;
        }

        bool read_row(std::vector<std::string> &out)
        {
            out.clear();
            if (!file_.is_open())
                return false;

            std::string line;
            while (std::getline(file_, line))
            {
                if (is_blank(line))
                    continue;
                if (!line.empty() && line[0] == '#')
                    continue;

                strip_cr(line);
                out = parse_line(line);
                if (out.size() < header_.size())
                    out.resize(header_.size());

                for (auto &cell : out)
                    trim_inplace(cell);

                return true;
            }
            return false;
        }

        int col(const std::string &name) const
        {
            auto it = col_index_.find(name);
            if (it == col_index_.end())
                return -1;
            return it->second;
        }

        bool has_col(const std::string &name) const { return col(name) >= 0; }

        const std::vector<std::string> &header() const { return header_; }

        std::string get(const std::vector<std::string> &row,
                        const std::string &col_name) const
        {
            int idx = col(col_name);
            if (idx < 0 || static_cast<size_t>(idx) >= row.size())
                return "";
            return row[static_cast<size_t>(idx)];
        }

        static double to_double(const std::string &s, double default_val = 0.0)
        {
            if (s.empty())
                return default_val;
            // supports scientific notation (1.00E-07)
            return parse_whole(s);
        }

        // Empty cells and "nan"/"null" read as NaN
        static double to_nullable_double(const std::string &s)
        {
            const std::string v = to_lower(s);
            if (v.empty() || v == "nan" || v == "null")
                return std::numeric_limits<double>::quiet_NaN();
            return parse_whole(s);
        }

    private:
        // std::stod that rejects trailing characters ("85abc")
        static double parse_whole(const std::string &s)
        {
            size_t pos = 0;
            const double v = std::stod(s, &pos);
            if (pos != s.size())
                throw std::invalid_argument("trailing characters in number '" + s + "'");
            return v;
        }

        static bool is_blank(const std::string &s)
        {
            for (char c : s)
                if (!std::isspace(static_cast<unsigned char>(c)))
                    return false;
            return true;
        }

        static void strip_cr(std::string &s)
        {
            if (!s.empty() && s.back() == '\r')
                s.pop_back();
        }

        static std::string to_lower(const std::string &s)
        {
            std::string out;
            out.reserve(s.size());
            for (char c : s)
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            return out;
        }

        static void trim_inplace(std::string &s)
        {
            size_t b = 0;
            while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
                b++;
            size_t e = s.size();
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                e--;
            s = s.substr(b, e - b);
        }

        static std::vector<std::string> parse_line(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string cur;
            cur.reserve(line.size());

            bool in_quotes = false;
            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];

                if (in_quotes)
                {
                    if (c == '"')
                    {
                        if (i + 1 < line.size() && line[i + 1] == '"')
                        {
                            cur.push_back('"');
                            ++i;
                        }
                        else
                        {
                            in_quotes = false;
                        }
                    }
                    else
                    {
                        cur.push_back(c);
                    }
                }
                else
                {
                    if (c == '"')
                    {
                        in_quotes = true;
                    }
                    else if (c == ',')
                    {
                        fields.push_back(cur);
                        cur.clear();
                    }
                    else
                    {
                        cur.push_back(c);
                    }
                }
            }
            fields.push_back(cur);
            return fields;
        }

    private:
        std::ifstream file_;
        std::vector<std::string> header_;
        std::unordered_map<std::string, int> col_index_;
    };

    // Row-at-a-time CSV writer; quotes cells containing ',', '"' or newlines.
    class CsvWriter
    {
    public:
        CsvWriter() = default;

        bool open(const std::string &path)
        {
            file_.open(path, std::ios::out | std::ios::trunc);
            return file_.is_open();
        }

        void write_row(const std::vector<std::string> &cells)
        {
            for (size_t i = 0; i < cells.size(); ++i)
            {
                if (i > 0)
                    file_ << ',';
                file_ << quote(cells[i]);
            }
            file_ << '\n';
        }

        bool good() const { return file_.good(); }

        void close()
        {
            if (file_.is_open())
                file_.close();
        }

        // NaN is written as an empty cell
        static std::string format_double(double v)
        {
            if (std::isnan(v))
                return "";
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.6f", v);
            return buf;
        }

    private:
        static std::string quote(const std::string &s)
        {
            if (s.find_first_of(",\"\n") == std::string::npos)
                return s;
            std::string out = "\"";
            for (char c : s)
            {
                if (c == '"')
                    out.push_back('"');
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

        std::ofstream file_;
    };

} // namespace utils
