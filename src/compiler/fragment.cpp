#include "compiler/fragment.hpp"

namespace treepat {

Fragment Fragment::single(std::string code, Test test) {
  Fragment fragment;
  fragment.code = std::move(code);
  fragment.arity = Arity::single();
  fragment.step = [test = std::move(test)](MatchFrame &frame,
                                           const ValueList &elements,
                                           size_t position, Continuation next) {
    if (position >= elements.size() || !test(frame, elements[position])) {
      return false;
    }
    return next(position + 1);
  };
  return fragment;
}

} // namespace treepat
