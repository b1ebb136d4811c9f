/*
 * 설명: 줄 단위 상태 이벤트 입력을 디코딩해 정규 형태로 다시 쓰는 도구 실행 단위를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/tool_app_test.cpp
 */
#pragma once

#include <istream>
#include <ostream>

#include "roomevents/config.hpp"

namespace roomevents {

class ToolApp {
 public:
  explicit ToolApp(ToolConfig config);

  // 빈 줄은 건너뛴다. 성공한 줄은 입력 순서대로 out에, 로그는 log에 쓴다.
  // 모든 줄이 성공하면 0, 하나라도 실패하면 1.
  int Run(std::istream& in, std::ostream& out, std::ostream& log);

 private:
  ToolConfig config_;
};

}  // namespace roomevents
