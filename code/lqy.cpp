#include <cstdlib>
#include <iostream>
#include "app.h"
#include "cli.h"
#include "options.h"

int main(int argc, char** argv)
{
    try
    {
        lqy::options opts = lqy::options::parse(argc, argv);
        lqy::app     app(opts, !cli::stdin_is_terminal());
        app.colorize = cli::stderr_is_terminal();
        return app.run(std::cin, std::cout, std::cerr);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
