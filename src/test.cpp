#include "strata/kernel/session.h"
#include "strata/policy/modules.h"
#include <thread>

using namespace strata;

class tests
{
public:
	struct fixture
	{
		static std::string_view modules_document()
		{
			return R"({
				"modules": [
				{
					"address": "0x1",
					"name": "test",
					"structs": [
						{ "name": "Pair", "abilities": ["copy", "drop"], "fields": [{ "name": "a", "type": "u64" }, { "name": "b", "type": "bool" }] },
						{ "name": "Coin", "abilities": ["store", "key"], "fields": [{ "name": "value", "type": "u64" }] },
						{ "name": "Counter", "abilities": ["drop", "store", "key"], "fields": [{ "name": "value", "type": "u64" }] },
						{ "name": "Box", "abilities": ["copy", "drop", "store"], "parameters": [{ "constraints": [] }], "fields": [{ "name": "value", "type": "T0" }] },
						{ "name": "Ghost", "abilities": ["copy", "drop"], "parameters": [{ "phantom": true }], "fields": [{ "name": "flag", "type": "bool" }] },
						{ "name": "Vault", "abilities": ["key"], "parameters": [{ "constraints": ["store"] }], "fields": [{ "name": "items", "type": "vector<T0>" }] },
						{ "name": "Account", "abilities": ["key"], "fields": [{ "name": "owner", "type": "address" }, { "name": "balance", "type": "0x1::test::Coin" }] }
					]
				}]
			})";
		}
		static policy::schema_module_provider* provider()
		{
			static policy::schema_module_provider* instance = nullptr;
			if (!instance)
			{
				instance = new policy::schema_module_provider();
				auto count = instance->load_document(modules_document());
				VI_PANIC(count && *count == 1, "test module document is not valid: %s", count ? "wrong module count" : count.error().what());
			}
			return instance;
		}
		static algorithm::account_address address_of(const std::string_view& text)
		{
			auto result = algorithm::encoding::decode_address(text);
			VI_PANIC(result, "address %.*s is not valid", (int)text.size(), text.data());
			return *result;
		}
		static ledger::module_id module()
		{
			return ledger::module_id(address_of("0x1"), "test");
		}
		static ledger::struct_tag tag_of(const std::string_view& name, vector<ledger::type_tag>&& arguments = { })
		{
			return ledger::struct_tag(module(), name, std::move(arguments));
		}
		static ledger::type_tag type_of(const std::string_view& text)
		{
			auto result = ledger::type_tag::from_string(text, 64);
			VI_PANIC(result, "type %.*s is not valid: %s", (int)text.size(), text.data(), result ? "" : result.error().what());
			return *result;
		}
		static ledger::type_tag nested_vector(size_t levels)
		{
			ledger::type_tag result = ledger::type_tag::u64();
			for (size_t i = 0; i < levels; i++)
				result = ledger::type_tag::vector_of(result);
			return result;
		}
		template <typename... args>
		static vector<ledger::value> list(args&&... items)
		{
			vector<ledger::value> result;
			(result.push_back(std::move(items)), ...);
			return result;
		}
		static ledger::value coin(uint64_t amount)
		{
			return ledger::value::structure(tag_of("Coin"), list(ledger::value::u64(amount)));
		}
		static ledger::value counter(uint64_t amount)
		{
			return ledger::value::structure(tag_of("Counter"), list(ledger::value::u64(amount)));
		}
	};

	struct environment
	{
		ledger::type_resolver resolver;
		ledger::value_ops ops;
		ledger::value_codec codec;
		storage::memory_state_view store;
		storage::global_state state;
		ledger::borrow_tracker borrows;

		environment() : resolver(fixture::provider()), ops(&resolver), codec(&resolver), state(&store, &codec, &resolver), borrows(&ops, &state)
		{
		}
		void put(const std::string_view& address, const ledger::struct_tag& tag, const ledger::value& data)
		{
			auto bytes = codec.encode(data, tag.as_type());
			VI_PANIC(bytes, "resource encoding failed: %s", bytes ? "" : bytes.error().what());
			store.set(storage::resource_key(fixture::address_of(address), tag), *bytes);
		}
	};

public:
	/* type tag parser and printer */
	static void types_parsing()
	{
		auto* term = console::get();
		vector<std::string_view> samples = { "bool", "u8", "u64", "u128", "address", "signer", "vector<u8>", "vector<vector<u64>>", "0x1::test::Pair", "0x1::test::Box<vector<0x1::test::Coin>>", "0x2::market::Order<u64, 0x1::test::Ghost<bool>>" };
		for (auto& sample : samples)
		{
			auto type = fixture::type_of(sample);
			VI_PANIC(type.to_string() == sample, "type %.*s printed as %s", (int)sample.size(), sample.data(), type.to_string().c_str());
			VI_PANIC(fixture::type_of(type.to_string()) == type, "type %s is not stable", type.to_string().c_str());
		}

		VI_PANIC(fixture::type_of("T3") == ledger::type_tag::parameter(3), "parameter parse failed");
		VI_PANIC(fixture::type_of("u128").is_primitive() && !fixture::type_of("vector<u8>").is_primitive(), "primitive classification failed");
		VI_PANIC(!fixture::type_of("vector<T0>").is_concrete(), "parameter type is concrete");
		VI_PANIC(fixture::type_of("0x0001::test::Pair") == fixture::tag_of("Pair").as_type(), "address padding mismatch");
		VI_PANIC(fixture::type_of("vector<u8>") != fixture::type_of("vector<u64>"), "structural inequality failed");

		vector<std::string_view> malformed = { "", "u16", "vector", "vector<u8", "vector<u8, u64>", "0x1::test", "0xzz::test::Pair", "u64 u64", "0x1::test::Pair<>" };
		for (auto& sample : malformed)
			VI_PANIC(!ledger::type_tag::from_string(sample, 64), "malformed type %.*s was accepted", (int)sample.size(), sample.data());

		auto deep = ledger::type_tag::from_string("vector<vector<vector<u8>>>", 3);
		VI_PANIC(!deep && deep.error().is(vm_status::type_too_deep), "parser depth bound failed");
		term->fwrite_line("parsed %i types", (int)samples.size());
	}
	/* struct resolution and arity errors */
	static void types_resolution()
	{
		ledger::type_resolver resolver(fixture::provider());
		auto pair = resolver.resolve(fixture::tag_of("Pair"));
		VI_PANIC(pair && (*pair)->fields.size() == 2, "pair resolution failed");
		VI_PANIC(fixture::provider()->has_module(fixture::module()), "test module is not registered");

		auto field = (*pair)->field_index("b");
		VI_PANIC(field && *field == 1 && !(*pair)->field_index("c"), "field lookup failed");

		auto missing_module = resolver.resolve(ledger::struct_tag(ledger::module_id(fixture::address_of("0x9"), "absent"), "Pair"));
		VI_PANIC(!missing_module && missing_module.error().is(vm_status::module_not_found), "unknown module was resolved");

		auto missing_struct = resolver.resolve(fixture::tag_of("Absent"));
		VI_PANIC(!missing_struct && missing_struct.error().is(vm_status::module_not_found), "unknown struct was resolved");

		auto missing_argument = resolver.resolve(fixture::tag_of("Box"));
		VI_PANIC(!missing_argument && missing_argument.error().is(vm_status::type_arity_mismatch), "generic arity was not checked");

		auto extra_argument = resolver.resolve(fixture::tag_of("Pair", { ledger::type_tag::u8() }));
		VI_PANIC(!extra_argument && extra_argument.error().is(vm_status::type_arity_mismatch), "non generic arity was not checked");

		auto box = resolver.resolve(fixture::tag_of("Box", { ledger::type_tag::u8() }));
		VI_PANIC(box, "box resolution failed");

		auto fields = resolver.instantiate(**box, { fixture::type_of("vector<u8>") });
		VI_PANIC(fields && fields->size() == 1 && fields->front() == fixture::type_of("vector<u8>"), "box instantiation failed");

		auto vault = resolver.resolve(fixture::tag_of("Vault", { fixture::tag_of("Coin").as_type() }));
		VI_PANIC(vault, "vault resolution failed");

		auto unsatisfied = resolver.verify_type(fixture::type_of("0x1::test::Vault<0x1::test::Pair>"));
		VI_PANIC(!unsatisfied && unsatisfied.error().is(vm_status::ability_violation), "type parameter constraint was not checked");

		auto satisfied = resolver.verify_type(fixture::type_of("0x1::test::Vault<0x1::test::Coin>"));
		VI_PANIC(satisfied, "type parameter constraint rejected a valid argument");

		auto generic = resolver.verify_type(fixture::type_of("vector<T0>"));
		VI_PANIC(!generic && generic.error().is(vm_status::type_mismatch), "non concrete type was accepted");

		auto substituted = resolver.substitute(fixture::type_of("vector<T0>"), { ledger::type_tag::u8() });
		VI_PANIC(substituted && *substituted == fixture::type_of("vector<u8>"), "type parameter substitution failed");

		auto out_of_range = resolver.substitute(fixture::type_of("vector<T1>"), { ledger::type_tag::u8() });
		VI_PANIC(!out_of_range && out_of_range.error().is(vm_status::invariant_violation), "out of range type parameter was substituted");
	}
	/* ability computation for primitives, vectors and generic structs */
	static void types_abilities()
	{
		ledger::type_resolver resolver(fixture::provider());
		auto abilities = [&](const std::string_view& text)
		{
			auto result = resolver.abilities_of(fixture::type_of(text));
			VI_PANIC(result, "abilities of %.*s failed: %s", (int)text.size(), text.data(), result ? "" : result.error().what());
			return *result;
		};

		auto all = ledger::ability_set::all();
		auto copy_drop = ledger::ability_set({ ledger::ability::copy, ledger::ability::drop });
		auto copy_drop_store = ledger::ability_set({ ledger::ability::copy, ledger::ability::drop, ledger::ability::store });
		for (auto& primitive : { "bool", "u8", "u64", "u128", "address" })
			VI_PANIC(abilities(primitive) == all, "primitive %s lacks abilities", primitive);

		VI_PANIC(abilities("signer") == ledger::ability_set({ ledger::ability::drop }), "signer abilities mismatch");
		VI_PANIC(abilities("vector<u64>") == copy_drop_store, "vector<u64> abilities mismatch");
		VI_PANIC(abilities("vector<0x1::test::Coin>") == ledger::ability_set({ ledger::ability::store }), "vector<Coin> abilities mismatch");
		VI_PANIC(abilities("0x1::test::Pair") == copy_drop, "pair abilities mismatch");
		VI_PANIC(abilities("0x1::test::Coin") == ledger::ability_set({ ledger::ability::store, ledger::ability::key }), "coin abilities mismatch");
		VI_PANIC(abilities("0x1::test::Box<u64>") == copy_drop_store, "box<u64> abilities mismatch");
		VI_PANIC(abilities("0x1::test::Box<0x1::test::Coin>") == ledger::ability_set({ ledger::ability::store }), "box<Coin> abilities mismatch");
		VI_PANIC(abilities("0x1::test::Box<0x1::test::Pair>") == copy_drop, "box<Pair> abilities mismatch");
		VI_PANIC(abilities("0x1::test::Ghost<0x1::test::Coin>") == copy_drop, "phantom argument restricted abilities");
		VI_PANIC(abilities("0x1::test::Vault<0x1::test::Coin>") == ledger::ability_set({ ledger::ability::key }), "vault<Coin> abilities mismatch");

		auto agreement = resolver.verify_abilities(fixture::type_of("0x1::test::Pair"), copy_drop);
		VI_PANIC(agreement, "matching abilities reported as divergent");

		auto divergence = resolver.verify_abilities(fixture::type_of("0x1::test::Coin"), copy_drop);
		VI_PANIC(!divergence && divergence.error().is_invariant_violation(), "ability divergence was not escalated");
	}
	/* generic instantiation depth bound */
	static void types_depth_bound()
	{
		const uint32_t max_depth = 8;
		ledger::type_resolver resolver(fixture::provider(), max_depth, 32);
		auto box = resolver.resolve(fixture::tag_of("Box", { ledger::type_tag::u8() }));
		VI_PANIC(box, "box resolution failed");

		auto at_limit = resolver.instantiate(**box, { fixture::nested_vector(max_depth - 2) });
		VI_PANIC(at_limit, "instantiation at the depth limit failed: %s", at_limit ? "" : at_limit.error().what());
		VI_PANIC(fixture::tag_of("Box", { fixture::nested_vector(max_depth - 2) }).as_type().depth() == max_depth, "depth measure mismatch");

		auto beyond_limit = resolver.instantiate(**box, { fixture::nested_vector(max_depth - 1) });
		VI_PANIC(!beyond_limit && beyond_limit.error().is(vm_status::type_too_deep), "instantiation beyond the depth limit was accepted");

		auto vault = resolver.resolve(fixture::tag_of("Vault", { fixture::tag_of("Coin").as_type() }));
		VI_PANIC(vault, "vault resolution failed");

		auto deep_vault = fixture::tag_of("Vault", { fixture::nested_vector(max_depth - 2) }).as_type();
		VI_PANIC(resolver.verify_type(deep_vault), "vault at the depth limit was rejected");

		auto deep_layout = resolver.instantiate(**vault, { fixture::nested_vector(max_depth - 2) });
		VI_PANIC(!deep_layout && deep_layout.error().is(vm_status::type_too_deep) && deep_layout.error().is_invariant_violation(), "field layout beyond the depth limit was not escalated");

		auto adversarial = fixture::nested_vector(4096);
		auto verification = resolver.verify_type(adversarial);
		VI_PANIC(!verification && verification.error().is(vm_status::type_too_deep), "adversarial nesting was accepted");

		auto abilities = resolver.abilities_of(adversarial);
		VI_PANIC(!abilities && abilities.error().is(vm_status::type_too_deep), "adversarial nesting abilities were computed");
	}
	/* module cache keeps the first definition under concurrent inserts */
	static void types_cache_concurrency()
	{
		auto* cache = ledger::type_cache::get();
		auto id = ledger::module_id(fixture::address_of("0x2"), "race");
		const size_t workers = 8;
		vector<const ledger::module_definition*> results(workers, nullptr);
		vector<std::thread> threads;
		for (size_t i = 0; i < workers; i++)
		{
			threads.emplace_back([&, i]()
			{
				ledger::struct_def item;
				item.module = id;
				item.name = "Item" + std::to_string(i);
				item.abilities = ledger::ability_set({ ledger::ability::drop });
				item.fields.push_back({ "value", ledger::type_tag::u64() });

				ledger::module_definition definition;
				definition.id = id;
				auto name = item.name;
				definition.structs[name] = std::move(item);
				results[i] = cache->insert(std::move(definition));
			});
		}
		for (auto& thread : threads)
			thread.join();

		auto* winner = cache->find(id);
		VI_PANIC(winner != nullptr && winner->structs.size() == 1, "module was not cached");
		for (auto* result : results)
			VI_PANIC(result == winner, "concurrent insert replaced the first definition");
	}
	/* pack and unpack shape checks */
	static void values_pack_unpack()
	{
		environment env;
		auto pair = env.ops.pack(fixture::tag_of("Pair"), fixture::list(ledger::value::u64(7), ledger::value::boolean(true)));
		VI_PANIC(pair, "pair pack failed: %s", pair ? "" : pair.error().what());
		VI_PANIC(pair->type_of() == fixture::tag_of("Pair").as_type(), "pair type mismatch");

		auto short_pair = env.ops.pack(fixture::tag_of("Pair"), fixture::list(ledger::value::u64(7)));
		VI_PANIC(!short_pair && short_pair.error().is(vm_status::field_mismatch), "field count was not checked");

		auto swapped_pair = env.ops.pack(fixture::tag_of("Pair"), fixture::list(ledger::value::boolean(true), ledger::value::u64(7)));
		VI_PANIC(!swapped_pair && swapped_pair.error().is(vm_status::field_mismatch), "field types were not checked");

		auto dropped_flag = ledger::value::boolean(true);
		VI_PANIC(env.ops.drop_value(std::move(dropped_flag)), "bool drop failed");
		auto empty_pair = env.ops.pack(fixture::tag_of("Pair"), fixture::list(ledger::value::u64(7), std::move(dropped_flag)));
		VI_PANIC(!empty_pair && empty_pair.error().is(vm_status::field_mismatch), "empty value was packed into a bool field");

		auto boxed = env.ops.pack(fixture::tag_of("Box", { ledger::type_tag::u8() }), fixture::list(ledger::value::u8(1)));
		VI_PANIC(boxed, "generic pack failed");

		auto wrong_box = env.ops.pack(fixture::tag_of("Box", { ledger::type_tag::u8() }), fixture::list(ledger::value::u64(1)));
		VI_PANIC(!wrong_box && wrong_box.error().is(vm_status::field_mismatch), "generic field type was not checked");

		auto wrong_unpack = env.ops.unpack(std::move(*boxed), fixture::tag_of("Box", { ledger::type_tag::u64() }));
		VI_PANIC(!wrong_unpack && wrong_unpack.error().is(vm_status::type_mismatch), "unpack type was not checked");

		auto resource = fixture::coin(10);
		auto coin_fields = env.ops.unpack(std::move(resource), fixture::tag_of("Coin"));
		VI_PANIC(coin_fields && coin_fields->size() == 1 && coin_fields->front().as_u64() == 10, "unpack of a resource failed");

		auto fields = env.ops.unpack(std::move(*pair), fixture::tag_of("Pair"));
		VI_PANIC(fields && fields->size() == 2, "pair unpack failed");
		VI_PANIC(fields->at(0).as_u64() == 7 && fields->at(1).as_boolean(), "pair fields mismatch");
	}
	/* copy and drop enforcement */
	static void values_copy_rules()
	{
		environment env;
		auto resource = fixture::coin(10);
		auto copied = env.ops.copy_value(resource);
		VI_PANIC(!copied && copied.error().is(vm_status::ability_violation), "resource was copied");

		auto dropped = env.ops.drop_value(std::move(resource));
		VI_PANIC(!dropped && dropped.error().is(vm_status::ability_violation), "resource was dropped");

		auto nested = env.ops.pack(fixture::tag_of("Box", { fixture::tag_of("Coin").as_type() }), fixture::list(fixture::coin(3)));
		VI_PANIC(nested, "box<Coin> pack failed");

		auto nested_copy = env.ops.copy_value(*nested);
		VI_PANIC(!nested_copy && nested_copy.error().is(vm_status::ability_violation), "resource inside a generic wrapper was copied");

		auto bytes = env.ops.pack_vector(ledger::type_tag::u8(), fixture::list(ledger::value::u8(1), ledger::value::u8(2)));
		VI_PANIC(bytes, "vector pack failed");

		auto duplicate = env.ops.copy_value(*bytes);
		VI_PANIC(duplicate, "vector copy failed");

		auto status = env.ops.vector_push_back(*duplicate, ledger::type_tag::u8(), ledger::value::u8(3));
		VI_PANIC(status, "vector push failed");
		VI_PANIC(bytes->items.size() == 2 && duplicate->items.size() == 3, "copy aliases the original");

		VI_PANIC(env.ops.drop_value(std::move(*duplicate)), "vector drop failed");
	}
	/* structural equality across value kinds */
	static void values_equality()
	{
		environment env;
		using ledger::value;
		VI_PANIC(ledger::value_ops::structural_equals(value::u64(7), value::u64(7)), "u64 equality failed");
		VI_PANIC(!ledger::value_ops::structural_equals(value::u64(7), value::u8(7)), "different kinds compared equal");
		VI_PANIC(!ledger::value_ops::structural_equals(value::account(fixture::address_of("0x1")), value::signer(fixture::address_of("0x1"))), "address compared equal to signer");
		VI_PANIC(value::signer(fixture::address_of("0x1")).as_address() == fixture::address_of("0x1"), "signer address mismatch");

		auto left = env.ops.pack_vector(ledger::type_tag::u64(), fixture::list(value::u64(1), value::u64(2)));
		auto right = env.ops.pack_vector(ledger::type_tag::u64(), fixture::list(value::u64(1), value::u64(2)));
		auto shorter = env.ops.pack_vector(ledger::type_tag::u64(), fixture::list(value::u64(1)));
		VI_PANIC(left && right && shorter, "vector pack failed");
		VI_PANIC(ledger::value_ops::structural_equals(*left, *right), "vector equality failed");
		VI_PANIC(!ledger::value_ops::structural_equals(*left, *shorter), "vectors of different length compared equal");

		auto empty_u8 = value::vector_of(ledger::type_tag::u8(), { });
		auto empty_u64 = value::vector_of(ledger::type_tag::u64(), { });
		VI_PANIC(!ledger::value_ops::structural_equals(empty_u8, empty_u64), "empty vectors of different types compared equal");

		auto frame = env.borrows.push_frame("equality", fixture::list(value::u64(5), value::u64(5)));
		VI_PANIC(frame, "frame push failed");

		auto first = env.borrows.borrow_local(*frame, 0, false);
		auto second = env.borrows.borrow_local(*frame, 0, false);
		auto other = env.borrows.borrow_local(*frame, 1, false);
		VI_PANIC(first && second && other, "shared borrows failed");
		VI_PANIC(ledger::value_ops::structural_equals(*first, *second), "references to one slot compared unequal");
		VI_PANIC(!ledger::value_ops::structural_equals(*first, *other), "references compared by pointee value");
	}
	/* vector operations and their type checks */
	static void values_vectors()
	{
		environment env;
		using ledger::value;
		auto element = ledger::type_tag::u64();
		auto items = env.ops.pack_vector(element, fixture::list(value::u64(1), value::u64(2), value::u64(3)));
		VI_PANIC(items, "vector pack failed");

		auto mixed = env.ops.pack_vector(element, fixture::list(value::u64(1), value::u8(2)));
		VI_PANIC(!mixed && mixed.error().is(vm_status::type_mismatch), "heterogeneous vector was packed");

		VI_PANIC(env.ops.vector_length(*items, element).or_else(0) == 3, "vector length mismatch");
		VI_PANIC(env.ops.vector_swap(*items, element, 0, 2), "vector swap failed");
		VI_PANIC(items->items.front().as_u64() == 3 && items->items.back().as_u64() == 1, "vector swap mismatch");

		auto out_of_range = env.ops.vector_swap(*items, element, 0, 3);
		VI_PANIC(!out_of_range, "out of range swap was accepted");

		auto wrong_item = env.ops.vector_push_back(*items, element, value::boolean(true));
		VI_PANIC(!wrong_item && wrong_item.error().is(vm_status::type_mismatch), "wrong element was pushed");

		auto flags = env.ops.pack_vector(ledger::type_tag::boolean(), fixture::list(value::boolean(false)));
		VI_PANIC(flags, "bool vector pack failed");
		auto empty_flag = env.ops.vector_push_back(*flags, ledger::type_tag::boolean(), value());
		VI_PANIC(!empty_flag && empty_flag.error().is(vm_status::type_mismatch), "empty value was pushed into a bool vector");
		VI_PANIC(flags->items.size() == 1, "rejected push changed the vector");

		auto wrong_element = env.ops.vector_length(*items, ledger::type_tag::u8());
		VI_PANIC(!wrong_element && wrong_element.error().is(vm_status::type_mismatch), "element type was not checked");

		auto not_empty = env.ops.vector_destroy_empty(std::move(*items), element);
		VI_PANIC(!not_empty && not_empty.error().is(vm_status::type_mismatch), "non empty vector was destroyed");

		for (size_t i = 0; i < 3; i++)
			VI_PANIC(env.ops.vector_pop_back(*items, element), "vector pop failed");

		auto underflow = env.ops.vector_pop_back(*items, element);
		VI_PANIC(!underflow, "pop from an empty vector was accepted");
		VI_PANIC(env.ops.vector_destroy_empty(std::move(*items), element), "empty vector destroy failed");

		auto exact = env.ops.unpack_vector(value::vector_of(element, fixture::list(value::u64(9))), element, 1);
		VI_PANIC(exact && exact->size() == 1, "vector unpack failed");

		auto inexact = env.ops.unpack_vector(value::vector_of(element, fixture::list(value::u64(9))), element, 2);
		VI_PANIC(!inexact, "vector unpack with a wrong length was accepted");

		ledger::value_ops limited(&env.resolver, 2);
		auto oversized = limited.pack_vector(element, fixture::list(value::u64(1), value::u64(2), value::u64(3)));
		VI_PANIC(!oversized && oversized.error().is(vm_status::value_too_large), "vector length limit was not enforced");
	}
	/* local borrow exclusivity and release */
	static void borrow_exclusivity()
	{
		environment env;
		using ledger::value;
		auto frame = env.borrows.push_frame("main", fixture::list(value::u64(1), value::u64(2)));
		VI_PANIC(frame, "frame push failed");

		VI_PANIC(env.borrows.get_depth() == 1, "call depth mismatch");

		auto exclusive = env.borrows.borrow_local(*frame, 0, true);
		VI_PANIC(exclusive, "mutable borrow failed");
		VI_PANIC(env.borrows.get_state(ledger::location::local(*frame, 0)) == ledger::borrow_state::exclusive, "slot is not exclusively borrowed");

		auto second_mutable = env.borrows.borrow_local(*frame, 0, true);
		VI_PANIC(!second_mutable && second_mutable.error().is(vm_status::borrow_conflict), "second mutable borrow was accepted");

		auto second_shared = env.borrows.borrow_local(*frame, 0, false);
		VI_PANIC(!second_shared && second_shared.error().is_invariant_violation(), "shared borrow of an exclusive slot was accepted");

		auto moved = env.borrows.move_local(0);
		VI_PANIC(!moved && moved.error().is(vm_status::borrow_conflict), "borrowed local was moved");

		VI_PANIC(env.borrows.write_ref(*exclusive, value::u64(10)), "write through an exclusive reference failed");
		VI_PANIC(env.borrows.release(std::move(*exclusive)), "release failed");
		VI_PANIC(env.borrows.get_state(ledger::location::local(*frame, 0)) == ledger::borrow_state::free, "slot is not free after release");

		auto shared_a = env.borrows.borrow_local(*frame, 0, false);
		auto shared_b = env.borrows.borrow_local(*frame, 0, false);
		VI_PANIC(shared_a && shared_b, "shared borrows failed");

		auto read = env.borrows.read_ref(*shared_a);
		VI_PANIC(read && read->as_u64() == 10, "write was not visible through a shared reference");

		auto upgrade = env.borrows.borrow_local(*frame, 0, true);
		VI_PANIC(!upgrade && upgrade.error().is(vm_status::borrow_conflict), "mutable borrow over shared borrows was accepted");

		auto shared_write = env.borrows.write_ref(*shared_a, value::u64(11));
		VI_PANIC(!shared_write && shared_write.error().is(vm_status::borrow_conflict), "write through a shared reference was accepted");

		VI_PANIC(env.borrows.release(std::move(*shared_a)), "release failed");
		VI_PANIC(env.borrows.get_state(ledger::location::local(*frame, 0)) == ledger::borrow_state::shared, "shared count mismatch");
		VI_PANIC(env.borrows.release(std::move(*shared_b)), "release failed");

		auto fresh = env.borrows.borrow_local(*frame, 0, true);
		VI_PANIC(fresh, "borrow after release failed");
		VI_PANIC(env.borrows.release(std::move(*fresh)), "release failed");

		auto taken = env.borrows.move_local(1);
		VI_PANIC(taken && taken->as_u64() == 2, "move of a free local failed");

		auto empty = env.borrows.borrow_local(*frame, 1, false);
		VI_PANIC(!empty && empty.error().is(vm_status::borrow_conflict), "borrow of a moved local was accepted");
		VI_PANIC(env.borrows.pop_frame(), "frame pop failed");
		VI_PANIC(env.borrows.get_live_borrows() == 0, "borrows leaked");
	}
	/* frame pop invalidates references and checks remaining locals */
	static void borrow_frame_pop()
	{
		environment env;
		using ledger::value;
		auto caller = env.borrows.push_frame("caller", fixture::list(value::u64(1)));
		VI_PANIC(caller, "caller push failed");

		auto caller_ref = env.borrows.borrow_local(*caller, 0, false);
		VI_PANIC(caller_ref, "caller borrow failed");

		auto callee = env.borrows.push_frame("callee", fixture::list(std::move(*caller_ref), value::u64(2)));
		VI_PANIC(callee, "callee push failed");

		auto callee_ref = env.borrows.borrow_local(*callee, 1, true);
		VI_PANIC(callee_ref, "callee borrow failed");
		VI_PANIC(env.borrows.pop_frame(), "callee pop failed");
		VI_PANIC(env.borrows.get_state(ledger::location::local(*caller, 0)) == ledger::borrow_state::free, "callee reference was not released");

		auto dangling = env.borrows.read_ref(*callee_ref);
		VI_PANIC(!dangling && dangling.error().is(vm_status::borrow_conflict) && dangling.error().is_invariant_violation(), "reference outlived its frame");

		auto holder = env.borrows.push_frame("holder", fixture::list(fixture::coin(5)));
		VI_PANIC(holder, "holder push failed");

		auto leak = env.borrows.pop_frame();
		VI_PANIC(!leak && leak.error().is(vm_status::ability_violation), "frame with an undroppable local was popped");

		auto resource = env.borrows.move_local(0);
		VI_PANIC(resource, "resource move failed");
		VI_PANIC(env.borrows.pop_frame(), "holder pop failed");
		VI_PANIC(env.borrows.pop_frame(), "caller pop failed");

		ledger::borrow_tracker shallow(&env.ops, &env.state, 2, 4);
		VI_PANIC(shallow.push_frame("a", { }) && shallow.push_frame("b", { }), "frame push failed");

		auto overflow = shallow.push_frame("c", { });
		VI_PANIC(!overflow && overflow.error().is(vm_status::call_stack_overflow), "call depth was not bounded");

		auto store = shallow.push_frame("d", { });
		VI_PANIC(!store, "call depth was not bounded");
	}
	/* global borrows go through the state adapter */
	static void borrow_global()
	{
		environment env;
		auto address = fixture::address_of("0xa");
		auto tag = fixture::tag_of("Counter");
		env.put("0xa", tag, fixture::counter(1));

		auto absent = env.borrows.borrow_global(fixture::address_of("0xb"), tag, false);
		VI_PANIC(!absent && absent.error().is(vm_status::resource_does_not_exist), "absent resource was borrowed");

		auto reference = env.borrows.borrow_global(address, tag, true);
		VI_PANIC(reference, "global borrow failed: %s", reference ? "" : reference.error().what());

		auto conflict = env.borrows.borrow_global(address, tag, false);
		VI_PANIC(!conflict && conflict.error().is(vm_status::borrow_conflict), "global exclusivity was not enforced");
		VI_PANIC(env.borrows.write_ref(*reference, fixture::counter(2)), "global write failed");
		VI_PANIC(env.borrows.release(std::move(*reference)), "global release failed");

		auto coin_tag = fixture::tag_of("Coin");
		env.put("0xa", coin_tag, fixture::coin(1));

		auto coin_reference = env.borrows.borrow_global(address, coin_tag, true);
		VI_PANIC(coin_reference, "coin borrow failed");

		auto overwrite = env.borrows.write_ref(*coin_reference, fixture::coin(2));
		VI_PANIC(!overwrite && overwrite.error().is(vm_status::ability_violation), "resource without drop was overwritten");
		VI_PANIC(env.borrows.release(std::move(*coin_reference)), "coin release failed");

		auto changes = env.state.finalize();
		VI_PANIC(changes && changes->size() == 1, "global write was not recorded");

		auto* op = changes->find(storage::resource_key(address, tag));
		VI_PANIC(op != nullptr && op->kind == storage::write_kind::modify, "global write kind mismatch");
		VI_PANIC(op->data == *env.codec.encode(fixture::counter(2), tag.as_type()), "global write data mismatch");
	}
	/* gas charges, exhaustion and intrinsic cost */
	static void gas_metering()
	{
		auto& config = protocol::now().gas;
		for (size_t i = 0; i < (size_t)gas_operation::count; i++)
		{
			ledger::gas_meter meter(config, std::numeric_limits<uint64_t>::max());
			auto operation = (gas_operation)i;
			for (uint64_t size = 1; size < 256; size++)
				VI_PANIC(meter.cost_of(operation, size) >= meter.cost_of(operation, size - 1), "gas cost of %s decreases with size", gas_schedule::name_of(operation).data());
			VI_PANIC(meter.cost_of(operation, std::numeric_limits<uint64_t>::max()) >= meter.cost_of(operation, 0), "gas cost overflowed");
		}

		ledger::gas_meter meter(config, 100);
		VI_PANIC(meter.get_schedule().at(gas_operation::pack).base == config.schedule.at(gas_operation::pack).base, "meter schedule mismatch");
		auto pack_cost = (uint64_t)meter.cost_of(gas_operation::pack, 9);
		VI_PANIC(meter.charge(gas_operation::pack, 9), "charge failed");
		VI_PANIC(meter.get_gas_used() == pack_cost && meter.get_gas_left() == 100 - pack_cost, "gas accounting mismatch");

		auto exhausted = meter.charge(gas_operation::serialize, 1000);
		VI_PANIC(!exhausted && exhausted.error().is(vm_status::out_of_gas), "budget overrun was accepted");
		VI_PANIC(meter.get_gas_used() == 100 && meter.get_gas_left() == 0 && meter.is_exhausted(), "used gas was not clamped");

		auto after = meter.charge(gas_operation::ret, 0);
		VI_PANIC(!after && after.error().is(vm_status::out_of_gas), "charge after exhaustion was accepted");

		auto small = ledger::gas_meter::calculate_intrinsic_gas(config, config.large_transaction_cutoff);
		auto large = ledger::gas_meter::calculate_intrinsic_gas(config, config.large_transaction_cutoff + 10);
		VI_PANIC(small && *small == config.min_transaction_gas_units, "intrinsic gas of a small transaction mismatch");
		VI_PANIC(large && *large == config.min_transaction_gas_units + 10 * config.intrinsic_gas_per_byte, "intrinsic gas of a large transaction mismatch");

		auto oversized = ledger::gas_meter::calculate_intrinsic_gas(config, config.max_transaction_size + 1);
		VI_PANIC(!oversized, "oversized transaction was accepted");

		auto budget = ledger::gas_meter::validate_budget(config, config.maximum_number_of_gas_units + 1, 0);
		VI_PANIC(!budget, "oversized gas budget was accepted");

		auto custom = config;
		custom.schedule.at(gas_operation::resource_load).per_byte = 100;
		ledger::gas_meter loader(custom, 10000);
		VI_PANIC((uint64_t)loader.cost_of(gas_operation::resource_load, 8) == custom.schedule.at(gas_operation::resource_load).base + 800, "global memory byte cost is not taken from the schedule");

		auto term = console::get();
		term->jwrite_line(*config.schedule.as_schema());
	}
	/* canonical encoding layout and round trip */
	static void codec_round_trip()
	{
		environment env;
		using ledger::value;
		auto pair = env.ops.pack(fixture::tag_of("Pair"), fixture::list(value::u64(7), value::boolean(true)));
		VI_PANIC(pair, "pair pack failed");

		auto pair_bytes = env.codec.encode(*pair, fixture::tag_of("Pair").as_type());
		VI_PANIC(pair_bytes && codec::hex_encode(*pair_bytes) == "070000000000000001", "pair encoding mismatch");

		uint128_t wide = 1;
		wide.high() = 2;
		auto wide_bytes = env.codec.encode(value::u128(wide), ledger::type_tag::u128());
		VI_PANIC(wide_bytes && codec::hex_encode(*wide_bytes) == "01000000000000000200000000000000", "u128 encoding mismatch");

		auto address_bytes = env.codec.encode(value::account(fixture::address_of("0x1")), ledger::type_tag::address());
		VI_PANIC(address_bytes && codec::hex_encode(*address_bytes) == "00000000000000000000000000000001", "address encoding mismatch");

		vector<value> long_items;
		for (size_t i = 0; i < 200; i++)
			long_items.push_back(value::u8((uint8_t)i));

		auto long_vector = value::vector_of(ledger::type_tag::u8(), std::move(long_items));
		auto long_bytes = env.codec.encode(long_vector, ledger::type_tag::vector_of(ledger::type_tag::u8()));
		VI_PANIC(long_bytes && long_bytes->size() == 202 && (uint8_t)(*long_bytes)[0] == 0xc8 && (uint8_t)(*long_bytes)[1] == 0x01, "vector length prefix mismatch");

		auto account_tag = fixture::tag_of("Account");
		auto account = env.ops.pack(account_tag, fixture::list(value::account(fixture::address_of("0xcafe")), fixture::coin(1000)));
		VI_PANIC(account, "account pack failed");

		auto nested = env.ops.pack_vector(fixture::type_of("vector<u64>"), fixture::list(
			value::vector_of(ledger::type_tag::u64(), fixture::list(value::u64(1), value::u64(std::numeric_limits<uint64_t>::max()))),
			value::vector_of(ledger::type_tag::u64(), { })));
		VI_PANIC(nested, "nested vector pack failed");

		vector<std::pair<value*, ledger::type_tag>> samples =
		{
			{ &*pair, fixture::tag_of("Pair").as_type() },
			{ &long_vector, ledger::type_tag::vector_of(ledger::type_tag::u8()) },
			{ &*account, account_tag.as_type() },
			{ &*nested, fixture::type_of("vector<vector<u64>>") }
		};
		for (auto& [sample, type] : samples)
		{
			auto bytes = env.codec.encode(*sample, type);
			VI_PANIC(bytes, "encoding of %s failed", type.to_string().c_str());

			auto decoded = env.codec.decode(*bytes, type);
			VI_PANIC(decoded, "decoding of %s failed: %s", type.to_string().c_str(), decoded ? "" : decoded.error().what());
			VI_PANIC(ledger::value_ops::structural_equals(*decoded, *sample), "round trip of %s mismatch", type.to_string().c_str());
			VI_PANIC(*env.codec.encode(*decoded, type) == *bytes, "re-encoding of %s mismatch", type.to_string().c_str());

			auto first_hash = env.codec.hash(*sample, type);
			auto second_hash = env.codec.hash(*decoded, type);
			VI_PANIC(first_hash && second_hash && *first_hash == *second_hash, "hash of %s is not stable", type.to_string().c_str());
		}

		auto mistyped = env.codec.encode(*pair, ledger::type_tag::u64());
		VI_PANIC(!mistyped && mistyped.error().is(vm_status::type_mismatch), "value was encoded under a foreign type");

		auto frame = env.borrows.push_frame("codec", fixture::list(value::u64(1)));
		auto reference = env.borrows.borrow_local(*frame, 0, false);
		VI_PANIC(reference, "borrow failed");

		auto reference_bytes = env.codec.encode(*reference, ledger::type_tag::u64());
		VI_PANIC(!reference_bytes, "reference was encoded");
	}
	/* non canonical input rejection */
	static void codec_canonical_rejections()
	{
		environment env;
		auto reject = [&](const std::string_view& hex, const ledger::type_tag& type, const char* reason)
		{
			auto decoded = env.codec.decode(codec::hex_decode(hex), type);
			VI_PANIC(!decoded && decoded.error().is(vm_status::deserialization_error), "%s was accepted", reason);
		};

		auto bytes = ledger::type_tag::vector_of(ledger::type_tag::u8());
		reject("02", ledger::type_tag::boolean(), "bool byte 2");
		reject("ff", ledger::type_tag::boolean(), "bool byte 255");
		reject("", ledger::type_tag::u8(), "empty u8");
		reject("01020304050607", ledger::type_tag::u64(), "truncated u64");
		reject("010000000000000000", ledger::type_tag::u64(), "u64 with a trailing byte");
		reject("0000000000000000000000000000000000", ledger::type_tag::address(), "address with a trailing byte");
		reject("000000000000000000000000000001", ledger::type_tag::address(), "truncated address");
		reject("8000", bytes, "non minimal length");
		reject("8100", bytes, "non minimal length with payload bits");
		reject("ffffffff0f", bytes, "length above the sequence limit");
		reject("ffffffffff01", bytes, "overflowing length");
		reject("03aabb", bytes, "length above the remaining input");
		reject("0170", fixture::type_of("vector<bool>"), "bool element byte 0x70");
		reject("0700000000000000", fixture::tag_of("Pair").as_type(), "struct with a missing field");
		reject("07000000000000000100", fixture::tag_of("Pair").as_type(), "struct with a trailing byte");

		auto accepted = env.codec.decode(codec::hex_decode("0201ff"), bytes);
		VI_PANIC(accepted && accepted->items.size() == 2, "canonical vector was rejected");

		ledger::value_codec limited(&env.resolver, 8, 1024);
		auto oversized = limited.decode(codec::hex_decode("0900000000000000ff"), bytes);
		VI_PANIC(!oversized && oversized.error().is(vm_status::deserialization_error), "oversized input was accepted");

		auto large_value = limited.encode(ledger::value::u128(uint128_t(5)), ledger::type_tag::u128());
		VI_PANIC(!large_value && large_value.error().is(vm_status::value_too_large), "oversized value was encoded");
	}
	/* last write wins and write kinds */
	static void state_write_set()
	{
		auto address = fixture::address_of("0xa");
		auto tag = fixture::tag_of("Coin");
		{
			environment env;
			VI_PANIC(env.state.set_resource(address, tag, fixture::coin(1)), "first write failed");
			VI_PANIC(env.state.set_resource(address, tag, fixture::coin(2)), "second write failed");

			auto changes = env.state.finalize();
			VI_PANIC(changes && changes->size() == 1, "write set holds stale entries");
			VI_PANIC(changes->ops.front().kind == storage::write_kind::modify, "rewrite kind mismatch");
			VI_PANIC(changes->ops.front().data == *env.codec.encode(fixture::coin(2), tag.as_type()), "last write did not win");
		}
		{
			environment env;
			VI_PANIC(env.state.set_resource(address, tag, fixture::coin(1)), "write failed");

			auto changes = env.state.finalize();
			VI_PANIC(changes && changes->size() == 1 && changes->ops.front().kind == storage::write_kind::create, "fresh resource was not created");
		}
		{
			environment env;
			env.put("0xa", tag, fixture::coin(1));
			VI_PANIC(env.state.set_resource(address, tag, fixture::coin(3)), "write failed");

			auto changes = env.state.finalize();
			VI_PANIC(changes && changes->size() == 1 && changes->ops.front().kind == storage::write_kind::modify, "stored resource was not modified");
		}
		{
			environment env;
			VI_PANIC(env.state.set_resource(fixture::address_of("0xb"), tag, fixture::coin(2)), "write failed");
			VI_PANIC(env.state.set_resource(fixture::address_of("0xa"), tag, fixture::coin(1)), "write failed");
			VI_PANIC(env.state.set_resource(fixture::address_of("0xa"), fixture::tag_of("Counter"), fixture::counter(1)), "write failed");

			auto changes = env.state.finalize();
			VI_PANIC(changes && changes->size() == 3, "write set size mismatch");
			for (size_t i = 1; i < changes->ops.size(); i++)
				VI_PANIC(changes->ops[i - 1].key.to_key() < changes->ops[i].key.to_key(), "write set is not ordered");

			VI_PANIC(env.state.is_finalized(), "state is not finalized");

			auto again = env.state.finalize();
			VI_PANIC(!again && again.error().is_invariant_violation(), "write set was finalized twice");
		}
		{
			environment env;
			auto not_key = env.state.set_resource(address, fixture::tag_of("Pair"), fixture::coin(1));
			VI_PANIC(!not_key && not_key.error().is(vm_status::ability_violation), "type without key was stored");

			auto mistyped = env.state.set_resource(address, tag, fixture::counter(1));
			VI_PANIC(!mistyped && mistyped.error().is(vm_status::type_mismatch), "value of a foreign type was stored");
		}
	}
	/* delete shadows the external store */
	static void state_delete_shadowing()
	{
		environment env;
		auto address = fixture::address_of("0xa");
		auto tag = fixture::tag_of("Coin");
		auto key = storage::resource_key(address, tag);
		env.put("0xa", tag, fixture::coin(7));

		auto before = env.state.get_resource(address, tag);
		VI_PANIC(before && (*before)->items.front().as_u64() == 7, "stored resource was not loaded");
		VI_PANIC(env.state.delete_resource(address, tag), "delete failed");

		auto after = env.state.get_resource(address, tag);
		VI_PANIC(!after && after.error().is(vm_status::resource_does_not_exist), "deleted resource is still visible");
		VI_PANIC(env.store.has(key), "external store was mutated");
		VI_PANIC(!*env.state.exists(address, tag), "deleted resource exists");

		auto twice = env.state.delete_resource(address, tag);
		VI_PANIC(!twice && twice.error().is(vm_status::resource_does_not_exist), "absent resource was deleted");

		size_t reads = env.store.get_reads();
		auto absent = env.state.get_resource(fixture::address_of("0xb"), tag);
		VI_PANIC(!absent && absent.error().is(vm_status::resource_does_not_exist), "absent resource was found");
		VI_PANIC(!env.state.get_resource(fixture::address_of("0xb"), tag), "absent resource was found");
		VI_PANIC(env.store.get_reads() == reads + 1, "absent resource was loaded twice");

		auto changes = env.state.finalize();
		VI_PANIC(changes && changes->size() == 1, "delete was not recorded");
		VI_PANIC(changes->ops.front().kind == storage::write_kind::erase && changes->ops.front().data.empty(), "delete op mismatch");

		env.store.apply(*changes);
		VI_PANIC(!env.store.has(key), "delete was not applied");
	}
	/* pack, copy and unpack through a session */
	static void session_end_to_end()
	{
		storage::memory_state_view store;
		ledger::transaction_session session(fixture::provider(), &store, 100000);
		using ledger::value;
		auto pair_tag = fixture::tag_of("Pair");
		auto abilities = session.load_type(pair_tag.as_type());
		VI_PANIC(abilities && *abilities == ledger::ability_set({ ledger::ability::copy, ledger::ability::drop }), "pair abilities mismatch");

		auto original = session.pack(pair_tag, fixture::list(value::u64(7), value::boolean(true)));
		VI_PANIC(original, "pack failed");

		auto duplicate = session.copy_value(*original);
		VI_PANIC(duplicate, "copy failed");

		auto equal = session.equals(*original, *duplicate);
		VI_PANIC(equal && *equal, "copy is not structurally equal");

		auto left = session.unpack(std::move(*original), pair_tag);
		auto right = session.unpack(std::move(*duplicate), pair_tag);
		VI_PANIC(left && right && left->size() == 2 && right->size() == 2, "unpack failed");
		VI_PANIC(left->at(0).as_u64() == 7 && right->at(0).as_u64() == 7, "u64 fields mismatch");
		VI_PANIC(left->at(1).as_boolean() && right->at(1).as_boolean(), "bool fields mismatch");
		VI_PANIC(ledger::value_ops::structural_equals(left->at(0), right->at(0)) && ledger::value_ops::structural_equals(left->at(1), right->at(1)), "fields are not pairwise equal");

		auto owner = fixture::address_of("0xbeef");
		VI_PANIC(session.move_to(owner, fixture::tag_of("Coin"), fixture::coin(50)), "move_to failed");

		auto duplicate_resource = session.move_to(owner, fixture::tag_of("Coin"), fixture::coin(60));
		VI_PANIC(!duplicate_resource && duplicate_resource.error().is(vm_status::resource_already_exists), "resource was published twice");

		auto result = session.finish();
		VI_PANIC(result.status == ledger::execution_status::failed, "failed session reported %s", ledger::execution_result::status_name(result.status).data());
		VI_PANIC(result.changes.empty() && result.gas_used > 0, "failed session kept its writes");

		ledger::transaction_session publish(fixture::provider(), &store, 100000);
		VI_PANIC(publish.charge_intrinsic(64), "intrinsic gas charge failed");
		VI_PANIC(publish.move_to(owner, fixture::tag_of("Coin"), fixture::coin(50)), "move_to failed");

		auto published = publish.finish();
		VI_PANIC(published.status == ledger::execution_status::success && published.changes.size() == 1, "publish session failed");
		VI_PANIC(published.changes.ops.front().kind == storage::write_kind::create, "publish kind mismatch");
		store.apply(published.changes);

		ledger::transaction_session withdraw(fixture::provider(), &store, 100000);
		auto before_load = withdraw.get_gas().get_gas_used();
		auto stored = withdraw.exists(owner, fixture::tag_of("Coin"));
		VI_PANIC(stored && *stored, "published resource does not exist");

		auto load_cost = withdraw.get_gas().cost_of(gas_operation::exists, 0) + withdraw.get_gas().cost_of(gas_operation::resource_load, 8);
		VI_PANIC(withdraw.get_gas().get_gas_used() - before_load == (uint64_t)load_cost, "resource load was not charged per byte");

		auto taken = withdraw.move_from(owner, fixture::tag_of("Coin"));
		VI_PANIC(taken && taken->items.front().as_u64() == 50, "move_from failed");

		auto fields = withdraw.unpack(std::move(*taken), fixture::tag_of("Coin"));
		VI_PANIC(fields && withdraw.drop_value(std::move(fields->front())), "coin destruction failed");

		auto withdrawn = withdraw.finish();
		VI_PANIC(withdrawn.status == ledger::execution_status::success && withdrawn.changes.size() == 1, "withdraw session failed");
		VI_PANIC(withdrawn.changes.ops.front().kind == storage::write_kind::erase, "withdraw kind mismatch");

		auto term = console::get();
		term->jwrite_line(*withdrawn.as_schema());
	}
	/* out of gas discards the write set and keeps the charge */
	static void session_out_of_gas()
	{
		storage::memory_state_view store;
		ledger::transaction_session session(fixture::provider(), &store, 100);
		using ledger::value;
		VI_PANIC(session.move_to(fixture::address_of("0xa"), fixture::tag_of("Coin"), fixture::coin(1)), "move_to failed");

		auto pair = session.pack(fixture::tag_of("Pair"), fixture::list(value::u64(7), value::boolean(true)));
		VI_PANIC(pair, "pack failed");

		auto copies = 0;
		while (session.get_status() == ledger::execution_status::executing)
		{
			auto copy = session.copy_value(*pair);
			if (!copy)
			{
				VI_PANIC(copy.error().is(vm_status::out_of_gas), "unexpected error: %s", copy.error().what());
				break;
			}
			++copies;
		}

		auto after = session.pack(fixture::tag_of("Pair"), fixture::list(value::u64(1), value::boolean(false)));
		VI_PANIC(!after && after.error().is(vm_status::out_of_gas), "operation after exhaustion was accepted");

		VI_PANIC(session.get_gas().is_exhausted() && session.get_error(), "exhaustion was not recorded");

		auto result = session.finish();
		VI_PANIC(result.status == ledger::execution_status::failed, "exhausted session status mismatch");
		VI_PANIC(result.error && result.error->is(vm_status::out_of_gas) && !result.error->is_invariant_violation(), "exhausted session error mismatch");
		VI_PANIC(result.gas_used == 100 && result.changes.empty(), "exhausted session kept writes or lost charges");
		VI_PANIC(!store.has(storage::resource_key(fixture::address_of("0xa"), fixture::tag_of("Coin"))), "exhausted session reached the store");
		console::get()->fwrite_line("copies before exhaustion: %i", copies);
	}
	/* locals, references, vectors, codec and globals through a session */
	static void session_operations()
	{
		storage::memory_state_view store;
		ledger::transaction_session session(fixture::provider(), &store, 100000);
		using ledger::value;
		auto element = ledger::type_tag::u64();
		auto vector_type = ledger::type_tag::vector_of(element);
		auto items = session.pack_vector(element, fixture::list(value::u64(1), value::u64(2)));
		VI_PANIC(items, "vector pack failed");

		auto frame = session.call("main", fixture::list(std::move(*items), value::u64(0)));
		VI_PANIC(frame, "call failed");

		auto reference = session.borrow_local(0, true);
		VI_PANIC(reference, "vector borrow failed");
		VI_PANIC(session.vector_push_back(*reference, element, value::u64(3)), "vector push failed");
		VI_PANIC(session.vector_swap(*reference, element, 0, 2), "vector swap failed");

		auto length = session.vector_length(*reference, element);
		VI_PANIC(length && *length == 3, "vector length mismatch");

		auto last = session.vector_pop_back(*reference, element);
		VI_PANIC(last && last->as_u64() == 1, "vector pop mismatch");
		VI_PANIC(session.release_ref(std::move(*reference)), "vector release failed");

		auto copied = session.copy_local(0);
		VI_PANIC(copied && copied->items.size() == 2, "local copy failed");

		auto bytes = session.serialize(*copied, vector_type);
		VI_PANIC(bytes && codec::hex_encode(*bytes) == "0203000000000000000200000000000000", "vector serialization mismatch");

		auto decoded = session.deserialize(*bytes, vector_type);
		VI_PANIC(decoded && ledger::value_ops::structural_equals(*decoded, *copied), "vector deserialization mismatch");

		auto digest = session.hash(*decoded, vector_type);
		VI_PANIC(digest && *digest == algorithm::hashing::hash256(*bytes), "vector hash mismatch");

		auto parts = session.unpack_vector(std::move(*decoded), element, 2);
		VI_PANIC(parts && parts->front().as_u64() == 3, "vector unpack failed");
		VI_PANIC(session.store_local(1, value::u64(42)), "local store failed");

		auto shared = session.borrow_local(1, false);
		VI_PANIC(shared, "local borrow failed");

		auto read = session.read_ref(*shared);
		VI_PANIC(read && read->as_u64() == 42, "local read mismatch");
		VI_PANIC(session.drop_value(std::move(*shared)), "reference drop failed");

		auto moved = session.move_local(1);
		VI_PANIC(moved && moved->as_u64() == 42, "local move failed");
		VI_PANIC(session.ret(), "return failed");

		auto empty = session.pack_vector(element, { });
		VI_PANIC(empty && session.vector_destroy_empty(std::move(*empty), element), "empty vector destroy failed");

		auto owner = fixture::address_of("0xd");
		auto tag = fixture::tag_of("Counter");
		auto absent = session.exists(owner, tag);
		VI_PANIC(absent && !*absent, "absent resource exists");
		VI_PANIC(session.set_resource(owner, tag, fixture::counter(1)), "resource write failed");

		auto present = session.exists(owner, tag);
		VI_PANIC(present && *present, "written resource does not exist");

		auto global = session.borrow_global(owner, tag, true);
		VI_PANIC(global, "global borrow failed");
		VI_PANIC(session.write_ref(*global, fixture::counter(9)), "global write failed");
		VI_PANIC(session.release_ref(std::move(*global)), "global release failed");

		auto before_read = session.get_gas().get_gas_used();
		auto resource = session.get_resource(owner, tag);
		VI_PANIC(session.get_gas().get_gas_used() - before_read == (uint64_t)session.get_gas().cost_of(gas_operation::borrow_global, 0), "resource read was not charged");
		VI_PANIC(resource && (*resource)->items.front().as_u64() == 9, "global write was not visible");
		VI_PANIC(session.delete_resource(owner, tag), "resource delete failed");
		VI_PANIC(session.set_resource(fixture::address_of("0xe"), tag, fixture::counter(3)), "resource write failed");

		auto result = session.finish();
		VI_PANIC(result.status == ledger::execution_status::success && result.changes.size() == 2, "session write set mismatch");
		VI_PANIC(result.changes.ops.front().kind == storage::write_kind::erase && result.changes.ops.back().kind == storage::write_kind::create, "session write kinds mismatch");
	}
	/* invariant faults are distinguishable from user failures */
	static void session_fault_distinction()
	{
		storage::memory_state_view store;
		using ledger::value;
		{
			ledger::transaction_session session(fixture::provider(), &store, 100000);
			VI_PANIC(session.call("main", fixture::list(value::u64(5))), "call failed");

			auto exclusive = session.borrow_local(0, true);
			VI_PANIC(exclusive, "borrow failed");

			VI_PANIC(session.get_borrows().get_live_borrows() == 1, "borrow was not tracked");

			auto conflict = session.borrow_local(0, false);
			VI_PANIC(!conflict && conflict.error().is(vm_status::borrow_conflict), "borrow conflict was not detected");

			auto result = session.finish();
			VI_PANIC(result.status == ledger::execution_status::faulted, "borrow conflict did not fault the session");
			VI_PANIC(result.error && result.error->is_invariant_violation(), "fault is not an invariant violation");
		}
		{
			ledger::transaction_session session(fixture::provider(), &store, 100000);
			auto resource = fixture::coin(1);
			VI_PANIC(session.get_ops().check_type(resource, fixture::tag_of("Coin").as_type()), "coin type mismatch");

			auto copy = session.copy_value(resource);
			VI_PANIC(!copy && copy.error().is(vm_status::ability_violation), "resource copy was accepted");

			auto result = session.finish();
			VI_PANIC(result.status == ledger::execution_status::failed && !result.error->is_invariant_violation(), "user error faulted the session");

			auto twice = session.finish();
			VI_PANIC(twice.status == ledger::execution_status::failed, "finished session changed status");
		}
		{
			ledger::transaction_session session(fixture::provider(), &store, 100000);
			auto owner = fixture::address_of("0xc");
			VI_PANIC(session.move_to(owner, fixture::tag_of("Counter"), fixture::counter(1)), "move_to failed");

			auto reference = session.borrow_global(owner, fixture::tag_of("Counter"), true);
			VI_PANIC(reference, "global borrow failed");

			auto taken = session.move_from(owner, fixture::tag_of("Counter"));
			VI_PANIC(!taken && taken.error().is(vm_status::borrow_conflict), "borrowed resource was moved");
			VI_PANIC(session.get_status() == ledger::execution_status::faulted, "borrowed resource move did not fault");
		}
		{
			ledger::transaction_session session(fixture::provider(), &store, 100000);
			auto element = fixture::nested_vector(protocol::now().limits.max_type_depth - 2);
			auto vault = session.pack(fixture::tag_of("Vault", { element }), fixture::list(value::vector_of(element, { })));
			VI_PANIC(!vault && vault.error().is(vm_status::type_too_deep), "vault with a deep field layout was packed");
			VI_PANIC(session.get_status() == ledger::execution_status::faulted, "deep field layout did not fault the session");
		}
		{
			ledger::transaction_session session(fixture::provider(), &store, 100000);
			VI_PANIC(session.finish().status == ledger::execution_status::success, "empty session failed");

			auto twice = session.finish();
			VI_PANIC(twice.status == ledger::execution_status::faulted, "second finish was accepted");
		}
	}
};

class runners
{
public:
	/* test case runner for regression testing */
	static int regression(inline_args& args)
	{
		vector<std::pair<std::string_view, std::function<void()>>> cases =
		{
			{ "types / parsing", &tests::types_parsing },
			{ "types / resolution", &tests::types_resolution },
			{ "types / abilities", &tests::types_abilities },
			{ "types / depth bound", &tests::types_depth_bound },
			{ "types / cache concurrency", &tests::types_cache_concurrency },
			{ "values / pack and unpack", &tests::values_pack_unpack },
			{ "values / copy rules", &tests::values_copy_rules },
			{ "values / equality", &tests::values_equality },
			{ "values / vectors", &tests::values_vectors },
			{ "borrow / exclusivity", &tests::borrow_exclusivity },
			{ "borrow / frame pop", &tests::borrow_frame_pop },
			{ "borrow / global", &tests::borrow_global },
			{ "gas / metering", &tests::gas_metering },
			{ "codec / round trip", &tests::codec_round_trip },
			{ "codec / canonical rejections", &tests::codec_canonical_rejections },
			{ "state / write set", &tests::state_write_set },
			{ "state / delete shadowing", &tests::state_delete_shadowing },
			{ "session / end to end", &tests::session_end_to_end },
			{ "session / out of gas", &tests::session_out_of_gas },
			{ "session / operations", &tests::session_operations },
			{ "session / fault distinction", &tests::session_fault_distinction },
		};

		auto* term = console::get();
		for (size_t i = 0; i < cases.size(); i++)
		{
			auto& [name, function] = cases[i];
			term->write_color(std_color::black, std_color::yellow);
			term->fwrite("  ===>  %s  <===  ", name.data());
			term->clear_color();
			term->write_char('\n');
			term->capture_time();

			function();

			double time = term->get_captured_time();
			term->write_color(std_color::white, std_color::dark_green);
			term->fwrite("  TEST PASS %.1fms %.2f%%  ", time, 100.0 * (double)(i + 1) / (double)cases.size());
			term->clear_color();
			term->write("\n\n");
		}
		return 0;
	}
};

int main(int argc, char* argv[])
{
	vitex::runtime scope;
	inline_args args = os::process::parse_args(argc, argv, (size_t)args_format::key | (size_t)args_format::key_value);
	protocol params = protocol(args);
	auto* term = console::get();
	term->show();

	int bad_entrypoint_exit_code = 0x39ce8025;
	int exit_code = bad_entrypoint_exit_code;
	auto test = args.get("test");
	if (test == "regression")
		exit_code = runners::regression(args);

	VI_PANIC(exit_code != bad_entrypoint_exit_code, "must provide a \"test\" flag (string in [regression])");
	ledger::type_cache::cleanup_instance();
	return exit_code;
}
