#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include <memory>
#include <sstream>

#include "bgend/types.h"
#include "bgend/game_config.h"
#include "bgend/board.h"
#include "bgend/moves.h"
#include "bgend/distribution.h"
#include "bgend/store.h"
#include "bgend/gnubg.h"

namespace py = pybind11;
using namespace bgend;

template <typename T>
static std::string to_repr(const T& v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

PYBIND11_MODULE(bgend_cpp, m) {
    m.doc() = "Exact bearoff database engine";

    // Errors derive from ValueError on the Python side, like the
    // std::invalid_argument they derive from in C++.
    py::register_exception<InvalidId>(m, "InvalidId", PyExc_ValueError);
    py::register_exception<InvalidSpotCounts>(m, "InvalidSpotCounts", PyExc_ValueError);
    py::register_exception<InvalidMove>(m, "InvalidMove", PyExc_ValueError);
    py::register_exception<UnnormalizedDistribution>(m, "UnnormalizedDistribution",
                                                     PyExc_RuntimeError);

    // --- GameConfiguration ---
    py::class_<GameConfiguration, std::shared_ptr<GameConfiguration>>(m, "GameConfiguration")
        .def(py::init<int, int>(), py::arg("num_markers"), py::arg("num_spots"))
        .def_property_readonly("num_markers", &GameConfiguration::num_markers)
        .def_property_readonly("num_spots", &GameConfiguration::num_spots)
        .def_property_readonly("num_valid_boards", &GameConfiguration::num_valid_boards)
        .def_property_readonly("min_board_id", &GameConfiguration::min_board_id)
        .def_property_readonly("max_board_id", &GameConfiguration::max_board_id)
        .def("is_valid_id", &GameConfiguration::is_valid_id, py::arg("board_id"))
        .def("next_valid_id", &GameConfiguration::next_valid_id, py::arg("board_id"),
             "Next larger valid id, or None after the largest")
        .def("generate_valid_ids", [](const GameConfiguration& self) {
            ValidIdRange ids = self.generate_valid_ids();
            return py::make_iterator(ids.begin(), ids.end());
        }, py::keep_alive<0, 1>());

    // --- Move / Roll ---
    py::class_<Move>(m, "Move")
        .def(py::init([](int spot, int count) { return Move{spot, count}; }),
             py::arg("spot"), py::arg("count"))
        .def_readwrite("spot", &Move::spot)
        .def_readwrite("count", &Move::count)
        .def(py::self == py::self)
        .def("__repr__", [](const Move& mv) {
            return "Move(spot=" + std::to_string(mv.spot) +
                   ", count=" + std::to_string(mv.count) + ")";
        });

    py::class_<Roll>(m, "Roll")
        .def_property_readonly("dice", [](const Roll& r) {
            return std::vector<int>(r.dice.begin(), r.dice.begin() + r.n_dice);
        })
        .def_readonly("prob", &Roll::prob)
        .def_readonly("weight", &Roll::weight)
        .def("is_double", &Roll::is_double);

    m.def("make_roll", &make_roll, py::arg("die1"), py::arg("die2"));
    m.attr("ROLLS") = std::vector<Roll>(ROLLS.begin(), ROLLS.end());

    // --- Board ---
    // Boards hold a pointer to their configuration; keep_alive ties the
    // configuration's lifetime to every board created from it.
    py::class_<Board>(m, "Board")
        .def(py::init<const GameConfiguration&, std::vector<int>>(),
             py::arg("config"), py::arg("spot_counts"), py::keep_alive<1, 2>())
        .def_static("from_id", &Board::from_id, py::arg("config"), py::arg("board_id"),
                    py::keep_alive<0, 1>())
        .def_property_readonly("spot_counts", &Board::spot_counts)
        .def("get_id", &Board::get_id)
        .def("is_finished", &Board::is_finished)
        .def("total_pips", &Board::total_pips)
        .def("next_valid_board", &Board::next_valid_board, py::keep_alive<0, 1>())
        .def("apply_move", &Board::apply_move, py::arg("move"), py::keep_alive<0, 1>())
        .def("apply_moves", &Board::apply_moves, py::arg("moves"), py::keep_alive<0, 1>())
        .def("generate_moves", &Board::generate_moves, py::arg("roll"))
        .def("pretty_string", &Board::pretty_string, py::arg("moves") = MoveList{})
        .def(py::self == py::self)
        .def("__repr__", &to_repr<Board>);

    m.def("encode_moves_string", &encode_moves_string, py::arg("moves"));
    m.def("decode_moves_string", &decode_moves_string, py::arg("s"));

    // --- MoveCountDistribution ---
    py::class_<MoveCountDistribution>(m, "MoveCountDistribution")
        .def(py::init<>())
        .def(py::init<std::vector<double>>(), py::arg("dist"))
        .def_property_readonly("dist", &MoveCountDistribution::values)
        .def(py::self + py::self)
        .def(py::self - py::self)
        .def(py::self * double())
        .def(py::self / double())
        .def("increase_counts", &MoveCountDistribution::increase_counts, py::arg("amount"))
        .def("append", &MoveCountDistribution::append, py::arg("values"))
        .def("is_normalized", &MoveCountDistribution::is_normalized)
        .def("expected_value", &MoveCountDistribution::expected_value)
        .def("__len__", &MoveCountDistribution::size)
        .def("__repr__", &to_repr<MoveCountDistribution>);

    // --- DistributionStore ---
    py::class_<ComputeConfig>(m, "ComputeConfig")
        .def(py::init<>())
        .def_readwrite("progress_interval", &ComputeConfig::progress_interval)
        .def_readwrite("limit", &ComputeConfig::limit);

    py::class_<DistributionStore>(m, "DistributionStore")
        .def(py::init([](std::shared_ptr<GameConfiguration> config) {
            return DistributionStore(std::move(config));
        }), py::arg("config"))
        .def_property_readonly("config", [](const DistributionStore& self) {
            return std::const_pointer_cast<GameConfiguration>(self.shared_config());
        })
        .def_property_readonly("rolls", &DistributionStore::rolls)
        .def("compute", [](DistributionStore& self, int progress_interval, long long limit) {
            ComputeConfig cc;
            cc.progress_interval = progress_interval;
            cc.limit = limit;
            py::gil_scoped_release release;
            self.compute(cc);
        }, py::arg("progress_interval") = 500, py::arg("limit") = -1)
        .def("compute_best_moves_for_roll", &DistributionStore::compute_best_moves_for_roll,
             py::arg("board"), py::arg("roll"))
        .def("compute_move_distribution_for_board",
             &DistributionStore::compute_move_distribution_for_board, py::arg("board"))
        .def("contains", &DistributionStore::contains, py::arg("board_id"))
        .def("__contains__", &DistributionStore::contains)
        .def("__getitem__", &DistributionStore::at, py::return_value_policy::copy)
        .def("__len__", &DistributionStore::size)
        .def("is_complete", &DistributionStore::is_complete)
        .def("pretty_string", &DistributionStore::pretty_string, py::arg("limit") = -1)
        .def("save", py::overload_cast<const std::string&>(&DistributionStore::save, py::const_),
             py::arg("filepath"))
        .def_static("load", py::overload_cast<const std::string&>(&DistributionStore::load),
                    py::arg("filepath"));

    // --- gnubg ---
    m.def("position_id_to_board", &position_id_to_board,
          py::arg("config"), py::arg("pos_id_str"), py::keep_alive<0, 1>(),
          "Decode a gnubg base64 position ID into a Board");
}
