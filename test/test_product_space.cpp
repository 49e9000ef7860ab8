#include <boost/test/unit_test.hpp>
#include <boost/lexical_cast.hpp>

#include "product_space.h"
#include <cmath>
#include <set>

using namespace mergeres;

typedef product_space_t<std::string> space_t;
typedef space_t::iterator_t::combination_t combination_t;

static space_t::set_ptr make_set(const std::string &label, size_t count)
{
	std::vector<std::string> vals;
	for(size_t f=0; f<count; ++f)
		vals.push_back(label+boost::lexical_cast<std::string>(f));
	return space_t::set_ptr(new vector_choice_set_t<std::string>(vals));
}

static std::string join(const combination_t &comb)
{
	std::string res;
	for(auto i=comb.begin(), iend=comb.end(); i!=iend; ++i)
	{
		if (!res.empty())
			res.append(",");
		res.append(*i);
	}
	return res;
}

BOOST_AUTO_TEST_CASE(test_space_size)
{
	space_t empty;
	BOOST_CHECK_EQUAL(empty.size(), 0);

	space_t space;
	space.connect(make_set("A", 2));
	space.connect(make_set("B", 3));
	space.connect(make_set("C", 4));
	BOOST_CHECK_EQUAL(space.size(), 24);
	BOOST_CHECK_EQUAL(space.dimensions(), 3u);

	space_t with_zero;
	with_zero.connect(make_set("A", 2));
	with_zero.connect(make_set("B", 0));
	with_zero.connect(make_set("C", 3));
	BOOST_CHECK_EQUAL(with_zero.size(), 0);
}

BOOST_AUTO_TEST_CASE(test_huge_size)
{
	space_t space;
	for(int f=0; f<200; ++f)
		space.connect(make_set("X", 10));

	double sz=space.size();
	BOOST_REQUIRE(std::isfinite(sz));
	BOOST_CHECK_CLOSE(sz, 1e200, 1e-6);
}

BOOST_AUTO_TEST_CASE(test_chain_links)
{
	space_t space;
	BOOST_CHECK(!space.head());
	BOOST_CHECK(!space.tail());

	space_t::node_t &a=space.connect(make_set("A", 2));
	space_t::node_t &b=space.connect(make_set("B", 3));
	space_t::node_t &c=space.connect(make_set("C", 1));

	BOOST_CHECK(space.head()==&a);
	BOOST_CHECK(space.tail()==&c);
	BOOST_CHECK(!a.prev());
	BOOST_CHECK(a.next()==&b);
	BOOST_CHECK(b.prev()==&a);
	BOOST_CHECK(b.next()==&c);
	BOOST_CHECK(!c.next());
	BOOST_CHECK_EQUAL(b.size(), 3);
}

BOOST_AUTO_TEST_CASE(test_empty_traversal)
{
	space_t space;
	space_t::iterator_t iter=space.traverse();
	BOOST_CHECK(!iter.has_next());

	combination_t comb(1, "untouched");
	BOOST_CHECK(!iter.next(&comb));
	BOOST_CHECK_EQUAL(comb.size(), 1u);
	BOOST_CHECK_EQUAL(comb.at(0), "untouched");
}

BOOST_AUTO_TEST_CASE(test_zero_dimension_traversal)
{
	space_t space;
	space.connect(make_set("A", 3));
	space.connect(make_set("B", 0));

	space_t::iterator_t iter=space.traverse();
	BOOST_CHECK(!iter.has_next());
	combination_t comb;
	BOOST_CHECK(!iter.next(&comb));
	BOOST_CHECK(comb.empty());
}

BOOST_AUTO_TEST_CASE(test_odometer_order)
{
	space_t space;
	space.connect(make_set("A", 2));
	space.connect(make_set("B", 3));

	const char *expected[] = {
		"A0,B0", "A0,B1", "A0,B2", "A1,B0", "A1,B1", "A1,B2"
	};

	space_t::iterator_t iter=space.traverse();
	combination_t comb;
	size_t count=0;
	while(iter.has_next())
	{
		BOOST_REQUIRE(iter.next(&comb));
		BOOST_REQUIRE(count<6);
		BOOST_CHECK_EQUAL(join(comb), expected[count]);
		++count;
	}
	BOOST_CHECK_EQUAL(count, 6u);
}

BOOST_AUTO_TEST_CASE(test_full_coverage)
{
	space_t space;
	space.connect(make_set("A", 3));
	space.connect(make_set("B", 1));
	space.connect(make_set("C", 4));
	space.connect(make_set("D", 2));

	std::set<std::string> seen;
	space_t::iterator_t iter=space.traverse();
	combination_t comb;
	double position=0;
	while(iter.next(&comb))
	{
		BOOST_REQUIRE_EQUAL(comb.size(), 4u);
		BOOST_CHECK(seen.insert(join(comb)).second);
		BOOST_CHECK_EQUAL(space.rank(iter.indices()), position);
		position+=1;
	}

	BOOST_CHECK_EQUAL(double(seen.size()), space.size());
	BOOST_CHECK_EQUAL(seen.size(), 24u);
	BOOST_CHECK(seen.count("A0,B0,C0,D0"));
	BOOST_CHECK(seen.count("A2,B0,C3,D1"));
}

BOOST_AUTO_TEST_CASE(test_single_dimension)
{
	space_t space;
	space.connect(make_set("A", 3));

	space_t::iterator_t iter=space.traverse();
	combination_t comb;
	std::vector<std::string> res;
	while(iter.next(&comb))
		res.push_back(join(comb));

	BOOST_REQUIRE_EQUAL(res.size(), 3u);
	BOOST_CHECK_EQUAL(res[0], "A0");
	BOOST_CHECK_EQUAL(res[2], "A2");
}

BOOST_AUTO_TEST_CASE(test_independent_traversals)
{
	space_t space;
	space.connect(make_set("A", 2));
	space.connect(make_set("B", 2));

	combination_t comb;
	space_t::iterator_t first=space.traverse();
	BOOST_REQUIRE(first.next(&comb));
	BOOST_REQUIRE(first.next(&comb));
	BOOST_CHECK_EQUAL(join(comb), "A0,B1");

	space_t::iterator_t second=space.traverse();
	BOOST_REQUIRE(second.next(&comb));
	BOOST_CHECK_EQUAL(join(comb), "A0,B0");

	BOOST_REQUIRE(first.next(&comb));
	BOOST_CHECK_EQUAL(join(comb), "A1,B0");
}

BOOST_AUTO_TEST_CASE(test_next_after_exhaustion)
{
	space_t space;
	space.connect(make_set("A", 1));
	space.connect(make_set("B", 2));

	space_t::iterator_t iter=space.traverse();
	combination_t comb;
	BOOST_REQUIRE(iter.next(&comb));
	BOOST_REQUIRE(iter.next(&comb));
	BOOST_CHECK_EQUAL(join(comb), "A0,B1");

	BOOST_CHECK(!iter.has_next());
	BOOST_CHECK(!iter.next(&comb));
	BOOST_CHECK(!iter.next(&comb));
	BOOST_CHECK_EQUAL(join(comb), "A0,B1");
}

BOOST_AUTO_TEST_CASE(test_traversal_outlives_space)
{
	boost::shared_ptr<space_t::iterator_t> iter;
	{
		space_t space;
		space.connect(make_set("A", 2));
		iter.reset(new space_t::iterator_t(space.traverse()));
	}

	combination_t comb;
	BOOST_REQUIRE(iter->next(&comb));
	BOOST_REQUIRE(iter->next(&comb));
	BOOST_CHECK_EQUAL(join(comb), "A1");
	BOOST_CHECK(!iter->has_next());
}

BOOST_AUTO_TEST_CASE(test_rank)
{
	space_t space;
	space.connect(make_set("A", 2));
	space.connect(make_set("B", 3));
	space.connect(make_set("C", 5));

	std::vector<size_t> idx;
	idx.push_back(1);
	idx.push_back(2);
	idx.push_back(4);
	BOOST_CHECK_EQUAL(space.rank(idx), 29);

	idx[2]=5;
	BOOST_CHECK_THROW(space.rank(idx), std::out_of_range);
	idx.pop_back();
	BOOST_CHECK_THROW(space.rank(idx), std::out_of_range);

	space_t empty;
	BOOST_CHECK_THROW(empty.rank(std::vector<size_t>()), std::out_of_range);
}

namespace {
	//Claims two candidates but has none
	class lying_set_t : public sized_choice_set_t<std::string>
	{
	public:
		virtual double size() const { return 2; }
		virtual cursor_ptr produce() const
		{
			return vector_choice_set_t<std::string>(
				std::vector<std::string>()).produce();
		}
	};
}; //namespace

BOOST_AUTO_TEST_CASE(test_lying_choice_set)
{
	space_t space;
	space.connect(make_set("A", 2));
	space.connect(space_t::set_ptr(new lying_set_t()));
	BOOST_CHECK_EQUAL(space.size(), 4);

	space_t::iterator_t iter=space.traverse();
	BOOST_CHECK(iter.has_next());

	combination_t comb(1, "untouched");
	BOOST_CHECK(!iter.next(&comb));
	BOOST_CHECK(!iter.has_next());
	BOOST_CHECK(!iter.next(&comb));
	BOOST_REQUIRE_EQUAL(comb.size(), 1u);
	BOOST_CHECK_EQUAL(comb[0], "untouched");
}
