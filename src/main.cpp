#include "agentlink/app.hpp"

int main(int argc, char *argv[]) {
    agentlink::App app;
    return app.run(argc, argv);
}
