/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다. 종료 시그널 처리는 ServerApp이 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collab_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "collab/app.hpp"

int main() {
  using namespace collab;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    // 잘못된 환경설정이나 저장소 초기화 실패는 시작 단계에서 종료한다.
    std::cerr << "서버 시작 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
