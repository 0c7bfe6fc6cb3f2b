#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <unistd.h>

namespace test_support
{
    // Fresh directory under the system temp dir, removed on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            static std::atomic<unsigned> seq{0};
            path_ = std::filesystem::temp_directory_path() /
                    ("dfs_test_" + std::to_string(::getpid()) + "_" + std::to_string(seq.fetch_add(1)));
            std::filesystem::remove_all(path_);
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }
        std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };

    // Settable time source for components that take a dfs_clock::Clock.
    struct ManualClock
    {
        std::shared_ptr<double> now = std::make_shared<double>(1000.0);

        double operator()() const { return *now; }
        void advance(double seconds) { *now += seconds; }
    };

    inline std::string random_bytes(std::size_t n, unsigned seed = 42)
    {
        std::mt19937 gen(seed);
        std::uniform_int_distribution<int> dist(0, 255);
        std::string out(n, '\0');
        for (auto &c : out)
            c = static_cast<char>(dist(gen));
        return out;
    }

    inline void write_file(const std::filesystem::path &p, const std::string &bytes)
    {
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    inline std::string read_file(const std::filesystem::path &p)
    {
        std::ifstream in(p, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
}
