#include "api/review_cli.hpp"

int main(int argc, char** argv) {
    return api::run_snapgate_main(argc, argv);
}
