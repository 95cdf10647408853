/*
 * 설명: std::visit용 람다 묶음 헬퍼.
 * 버전: v1.0.0
 */
#pragma once

namespace collab {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace collab
