/**
 * @file otpvault.cpp
 * @brief otpvault 메인 엔트리 포인트
 * @details 명령행 인수를 run_cli()에 넘기고 그 결과를 종료 코드로 반환합니다.
 *          명령 해석과 세부 구현은 src/cli.cpp에 작성되어 있습니다.
 */

#include <string>
#include <vector>

#include "src/cli.hpp"

using namespace std;

/**
 * @brief otpvault의 메인 함수
 * @param argc 명령행 인수 개수
 * @param argv 명령행 인수 배열
 * @return 0 성공, 1 실패, 2 인수 오류
 */
int main(int argc, char* argv[])
{
    vector<string> args(argv + 1, argv + argc);
    return run_cli(args);
}
