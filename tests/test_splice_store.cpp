#include "vector_splice_store.hpp"
#include "tree_splice_store.hpp"
#include <cassert>
#include <string>
#include <vector>

template <typename Store>
static void add(Store& st, size_t start, size_t end, const char* v) {
  st.insert(Splice{start, end, CowText::borrowed(v)});
}

template <typename Store>
static std::vector<OffsetRange> ranges(const Store& st) {
  std::vector<OffsetRange> out;
  st.for_each([&](const Splice& s) { out.push_back(s.range()); return true; });
  return out;
}

template <typename Store>
static std::string values(const Store& st) {
  std::string out;
  st.for_each([&](const Splice& s) { out.append(s.value.view()); return true; });
  return out;
}

template <typename Store>
static void run_store_tests() {
  {
    Store st;
    assert(st.empty());
    add(st, 6, 7, "c");
    add(st, 0, 1, "a");
    add(st, 3, 4, "b");
    assert(st.size() == 3);
    assert(values(st) == "abc");
    std::vector<OffsetRange> want{{0, 1}, {3, 4}, {6, 7}};
    assert(ranges(st) == want);
  }
  {
    // equal starts keep registration order
    Store st;
    add(st, 3, 3, "X");
    add(st, 3, 3, "Y");
    add(st, 1, 2, "a");
    add(st, 3, 5, "Z");
    assert(values(st) == "aXYZ");
  }
  {
    // an empty splice sorts before a non-empty one sharing its start
    Store st;
    add(st, 3, 5, "Z");
    add(st, 3, 3, "X");
    add(st, 3, 3, "Y");
    assert(values(st) == "XYZ");
    std::vector<OffsetRange> want{{3, 3}, {3, 3}, {3, 5}};
    assert(ranges(st) == want);
  }
  {
    // strict lookups see through a run of equal starts
    Store st;
    add(st, 5, 8, "w");
    assert(st.find_conflict(5, 5, OverlapPolicy::Strict) == nullptr);
    add(st, 5, 5, "e");
    const Splice* hit = st.find_conflict(6, 7, OverlapPolicy::Strict);
    assert(hit != nullptr);
    assert(hit->range() == (OffsetRange{5, 8}));
    assert(st.find_conflict(8, 9, OverlapPolicy::Strict) == nullptr);
    assert(st.find_conflict(4, 6, OverlapPolicy::Strict) != nullptr);
  }
  {
    Store st;
    add(st, 0, 1, "a");
    add(st, 2, 3, "b");
    add(st, 4, 5, "c");
    std::string seen;
    st.for_each([&](const Splice& s) { seen.append(s.value.view()); return s.start < 2; });
    assert(seen == "ab");
  }
  {
    Store st;
    add(st, 2, 7, "x");
    auto p = OverlapPolicy::StartPoint;
    assert(st.find_conflict(2, 3, p) != nullptr);
    assert(st.find_conflict(4, 9, p)->range() == (OffsetRange{2, 7}));
    assert(st.find_conflict(6, 6, p) != nullptr);
    assert(st.find_conflict(7, 8, p) == nullptr);
    // only the start point is checked
    assert(st.find_conflict(0, 3, p) == nullptr);
    assert(st.find_conflict(0, 9, p) == nullptr);
  }
  {
    // a wide splice registered later but sorting earlier still guards its span
    Store st;
    add(st, 5, 6, "n");
    assert(st.find_conflict(2, 10, OverlapPolicy::StartPoint) == nullptr);
    add(st, 2, 10, "w");
    const Splice* hit = st.find_conflict(7, 8, OverlapPolicy::StartPoint);
    assert(hit != nullptr);
    assert(hit->range() == (OffsetRange{2, 10}));
  }
  {
    Store st;
    add(st, 2, 7, "x");
    auto p = OverlapPolicy::Strict;
    assert(st.find_conflict(0, 3, p)->range() == (OffsetRange{2, 7}));
    assert(st.find_conflict(0, 9, p) != nullptr);
    assert(st.find_conflict(3, 3, p) != nullptr);
    // an insertion on its start only touches it
    assert(st.find_conflict(2, 2, p) == nullptr);
    assert(st.find_conflict(5, 9, p) != nullptr);
    assert(st.find_conflict(0, 2, p) == nullptr);
    assert(st.find_conflict(7, 9, p) == nullptr);
    assert(st.find_conflict(7, 7, p) == nullptr);
  }
  {
    // empty splices only collide with ranges strictly around them
    Store st;
    add(st, 4, 4, "i");
    auto p = OverlapPolicy::Strict;
    assert(st.find_conflict(0, 4, p) == nullptr);
    assert(st.find_conflict(4, 6, p) == nullptr);
    assert(st.find_conflict(4, 4, p) == nullptr);
    assert(st.find_conflict(0, 5, p)->range() == (OffsetRange{4, 4}));
  }
}

int main() {
  run_store_tests<VectorSpliceStore>();
  run_store_tests<TreeSpliceStore>();
  assert(VectorSpliceStore().get_name() == "vector");
  assert(TreeSpliceStore().get_name() == "tree");
  return 0;
}
