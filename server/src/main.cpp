/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다. SIGINT/SIGTERM을 받으면 실행기를 멈추고 정리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_stream_test.cpp
 */
#include <iostream>

#include "chatlive/app.hpp"

int main() {
  using namespace chatlive;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 값이 올바르지 않습니다: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);
  app.Run();
  app.Stop();
  return 0;
}
