#undef NDEBUG
#include"Graph/KShortest.hpp"
#include<assert.h>
#include<map>
#include<string>
#include<vector>

namespace {

typedef Graph::KShortest<std::string, int> Search;

/*
 * A --1-- B --1-- D
 *  \             /
 *   2           3
 *    \         /
 *     C ------
 */
std::map<std::string, std::map<std::string, int>> const graph = {
	{"A", {{"B", 1}, {"C", 2}}},
	{"B", {{"A", 1}, {"D", 1}}},
	{"C", {{"A", 2}, {"D", 3}}},
	{"D", {{"B", 1}, {"C", 3}}},
};

std::string walk(Search::TreeNode const* label) {
	auto ret = std::string();
	for (auto p = label; p; p = p->parent)
		ret = p->data.node + ret;
	return ret;
}

bool on_walk(Search::TreeNode const* label, std::string const& n) {
	for (auto p = label; p; p = p->parent) {
		if (p->data.node == n)
			return true;
	}
	return false;
}

/* Runs the search, keeping walks simple, and returns
 * the walks that end at `goal`, in the order they are
 * settled.  */
std::vector<std::pair<std::string, int>>
run(std::size_t k, std::string const& goal) {
	auto search = Search("A", k);
	auto found = std::vector<std::pair<std::string, int>>();
	while (auto label = search.current()) {
		if (label->data.node == goal) {
			found.emplace_back(walk(label), label->data.cost);
			search.end_neighbors();
			continue;
		}
		for (auto const& e : graph.at(label->data.node)) {
			if (on_walk(label, e.first))
				continue;
			search.neighbor(e.first, label->data.cost + e.second);
		}
		search.end_neighbors();
	}
	return found;
}

}

int main() {
	{
		auto search = Search("A", 1);
		assert(search.current());
		assert(search.current()->data.node == "A");
		assert(search.current()->data.cost == 0);
		assert(!search.current()->parent);
		assert(search.count("A") == 0);
		search.end_neighbors();
		assert(search.count("A") == 1);
		assert(!search.current());
	}

	{
		/* k = 0 never yields anything.  */
		auto search = Search("A", 0);
		assert(!search.current());
	}

	{
		/* With k = 1 this is plain Dijkstra.  */
		auto found = run(1, "D");
		assert(found.size() == 1);
		assert(found[0].first == "ABD");
		assert(found[0].second == 2);
	}

	{
		/* With k = 2 the second route shows up too, and
		 * comes out later because it costs more.  */
		auto found = run(2, "D");
		assert(found.size() == 2);
		assert(found[0].first == "ABD");
		assert(found[0].second == 2);
		assert(found[1].first == "ACD");
		assert(found[1].second == 5);
	}

	{
		/* No more than two simple routes exist.  */
		auto found = run(5, "D");
		assert(found.size() == 2);
	}

	{
		/* Neighbors past k settlements are ignored.  */
		auto search = Search("A", 1);
		search.neighbor("B", 1);
		search.end_neighbors();
		assert(search.current()->data.node == "B");
		assert(search.current()->parent->data.node == "A");
		search.neighbor("A", 2);
		search.end_neighbors();
		assert(!search.current());
	}

	{
		/* Equal costs come out in the order given.  */
		auto search = Search("A", 1);
		search.neighbor("C", 1);
		search.neighbor("B", 1);
		search.end_neighbors();
		assert(search.current()->data.node == "C");
		search.end_neighbors();
		assert(search.current()->data.node == "B");
	}

	{
		/* Costs can go down along a walk.  A neighbor
		 * cheaper than the label being expanded does
		 * not take its place.  */
		auto search = Search("A", 1, 10);
		search.neighbor("B", 3);
		assert(search.current()->data.node == "A");
		search.neighbor("C", 5);
		search.end_neighbors();
		assert(search.count("A") == 1);

		auto b = search.current();
		assert(b->data.node == "B");
		assert(b->data.cost == 3);
		search.neighbor("D", 1);
		assert(search.current() == b);
		search.neighbor("E", 2);
		assert(search.current() == b);
		search.end_neighbors();
		assert(search.count("B") == 1);
		assert(search.count("D") == 0);

		/* Both hang off B, and B is not expanded again.  */
		assert(search.current()->data.node == "D");
		assert(walk(search.current()) == "ABD");
		search.end_neighbors();
		assert(search.current()->data.node == "E");
		assert(walk(search.current()) == "ABE");
		search.end_neighbors();
		assert(search.current()->data.node == "C");
		assert(walk(search.current()) == "AC");
		search.end_neighbors();
		assert(!search.current());
	}

	return 0;
}
