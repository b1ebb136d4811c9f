/*
 * 설명: 도구 진입점으로 환경설정을 로드해 표준 입출력으로 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/tool_app_test.cpp
 */
#include <iostream>
#include <stdexcept>

#include "roomevents/tool_app.hpp"

int main() {
  using namespace roomevents;
  ToolConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 2;
  }

  ToolApp app(config);
  return app.Run(std::cin, std::cout, std::cerr);
}
