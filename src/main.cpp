#include <cpptrace/cpptrace.hpp>

#include "app.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    return run_app(argc, argv);
  } catch(std::exception& e) {
    init(false);
    Logger logger("zap-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
