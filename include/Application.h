#pragma once

#include <ostream>

/**
 * @brief Command-line front end: parses arguments, runs the conversion and
 *        maps failures to an exit status.
 * @details All console text goes to the two streams given at construction so
 *          main() only binds them to std::cout and std::cerr.
 */
class Application {
public:
    Application(std::ostream& out, std::ostream& err);

    /**
     * @return 0 on success or after --help, 1 on any fatal error.
     */
    int run(int argc, char* argv[]);

private:
    std::ostream& out_;
    std::ostream& err_;
};
