/*
/   This is utility library for tltmob
/   1. Random generator and independent per-realization streams
/   2. parsing input parameters
/   3. rank-0 console output
/   4. interrupt flag
*/

#pragma once

#include <errors.h>

#include <mpi.h>
#include <armadillo>

#include <random>
#include <map>
#include <string>
#include <vector>
#include <iostream>
#include <sstream>

namespace utility {

    class random {
    private:
        std::mt19937 generator_;
        std::normal_distribution<double> normal_;

    public:
        random() = default;
        explicit random(unsigned int seed) : generator_(seed) {}

        // Independent generator for realization `index` of a run seeded with `seed`
        static random stream(unsigned int seed, unsigned int index);

        void set_seed(unsigned int seed);

        // Standard normal deviate N(0, 1)
        double normal();

    };

    class parameters {
    private:
        std::map<std::string, std::map<std::string, std::string>> sections;

        void parseLine(const std::string& line, std::string& current_section);

    public:
        parameters() = default;
        explicit parameters(const std::string& filename);


        void set(const std::string& section, const std::string& key, const std::string& value);

        std::string getString(const std::string& section, const std::string& key) const;
        std::string getString(const std::string& section, const std::string& key, const std::string& default_value) const;

        int getInt(const std::string& section, const std::string& key) const;
        int getInt(const std::string& section, const std::string& key, int default_value) const;

        // full unsigned range, for seeds
        unsigned int getUnsigned(const std::string& section, const std::string& key) const;
        unsigned int getUnsigned(const std::string& section, const std::string& key, unsigned int default_value) const;

        double getDouble(const std::string& section, const std::string& key) const;
        double getDouble(const std::string& section, const std::string& key, double default_value) const;

        bool getBool(const std::string& section, const std::string& key) const;
        bool getBool(const std::string& section, const std::string& key, bool default_value) const;

        // "1.0, 2.0, 3.0"
        std::vector<double> getDoubleVector(const std::string& section, const std::string& key) const;
        std::vector<int> getIntVector(const std::string& section, const std::string& key) const;

        // rows separated by ';', columns by ',' : "1, 0, 0; 0, 1, 0; 0, 0, 1"
        arma::mat getMatrix(const std::string& section, const std::string& key) const;

        bool hasSection(const std::string& section) const;
        bool hasKey(const std::string& section, const std::string& key) const;
    };

    class io {
    public:
        static int rank() {
            int initialized = 0;
            MPI_Initialized(&initialized);
            if (!initialized) return 0;
            int finalized = 0;
            MPI_Finalized(&finalized);
            if (finalized) return 0;
            int r;
            MPI_Comm_rank(MPI_COMM_WORLD, &r);
            return r;
        }

        // Print only on MPI rank 0
        template <typename... Args>
        static void print_info(Args&&... args) {
            if (rank() != 0) return;
            (std::cout << ... << args) << std::flush;
        }

        // Stream manipulators apply to this string only, std::cout keeps its format
        template <typename... Args>
        static std::string format(Args&&... args) {
            std::ostringstream oss;
            (oss << ... << args);
            return oss.str();
        }

        static bool ensure_dir(const std::string& path);
    };

    namespace interrupt {
        // SIGINT / SIGTERM set a flag, polled between realizations
        void install();
        bool requested() noexcept;
        void request() noexcept;
        void reset() noexcept;
    }
}
