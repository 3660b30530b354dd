#include <istream>
#include <limits>
#include <map>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "boltz.hh"
#include "boltz_model.hh"
#include "boltz_optimizer.hh"
#include "boltz_trainer.hh"
#include "utils/io.hh"

#ifndef BOLTZ_IO_HH_
#define BOLTZ_IO_HH_

////////////////////////////////////////////////////////////////
// Checkpoint file (plain text, gzip if the name ends with .gz)
//
//   boltz_checkpoint 1
//   layer visible <bernoulli|gaussian> <size> <learn_var>
//   layer hidden  <bernoulli|gaussian> <size> <learn_var>
//   step <optimizer steps>
//   tensor <name> <rows> <cols>
//   <rows lines of cols numbers>
//   ...
//   rng <mt19937 state>
//   end
//
// Model tensors go by their parameter names.  Optimizer buffers
// are "momentum/<name>", "adam_m/<name>", "adam_v/<name>" and
// "adam_t/<name>" (1 x 1); the persistent chain is "chain"; the
// TAP seeds are "tap_visible" and "tap_hidden".
////////////////////////////////////////////////////////////////

namespace boltz {

constexpr int CHECKPOINT_VERSION = 1;

struct checkpoint_t {

    checkpoint_t()
        : step(0)
    {
    }

    std::shared_ptr<rbm_t> model;
    Index step;
    std::map<std::string, Mat> buffers; // optimizer buffers by key
    Mat chain;                          // empty unless PCD was running
    Mat tap_visible;                    // #seeds x #visible
    Mat tap_hidden;                     // #seeds x #hidden
    std::string rng_state;              // empty if not saved
};

inline int
write_tensor(std::ostream &ofs, const std::string &name, const Mat &M)
{
    ofs << "tensor " << name << " " << M.rows() << " " << M.cols() << "\n";
    CHK_ERR_RET(write_data_stream(ofs, M), "Failed to write " << name);
    return EXIT_SUCCESS;
}

inline void
write_layer(std::ostream &ofs, const std::string &role, const layer_t &layer)
{
    ofs << "layer " << role << " " << unit_name(unit_type(layer)) << " "
        << layer_size(layer) << " " << (learns_variance(layer) ? 1 : 0)
        << "\n";
}

inline int
write_model_stream(std::ostream &ofs, const rbm_t &model)
{
    ofs << "boltz_checkpoint " << CHECKPOINT_VERSION << "\n";
    write_layer(ofs, "visible", model.visible);
    write_layer(ofs, "hidden", model.hidden);

    std::vector<std::pair<std::string, const Mat *>> tensors;
    tensors.emplace_back("visible_bias", &layer_bias(model.visible));
    tensors.emplace_back("hidden_bias", &layer_bias(model.hidden));
    if (const Mat *lv = layer_log_var(model.visible))
        tensors.emplace_back("visible_log_var", lv);
    if (const Mat *lv = layer_log_var(model.hidden))
        tensors.emplace_back("hidden_log_var", lv);
    tensors.emplace_back("weight", &model.weight);

    for (const auto &it : tensors) {
        CHK_ERR_RET(write_tensor(ofs, it.first, *it.second),
                    "Failed to write the model");
    }
    return EXIT_SUCCESS;
}

inline int
write_session_stream(std::ostream &ofs, const training_session_t &session)
{
    const optimizer_state_t &state = session.optimizer.state;
    ofs << "step " << state.step << "\n";

    for (const auto &it : state.momentum) {
        CHK_ERR_RET(write_tensor(ofs, "momentum/" + it.first, it.second.V),
                    "Failed to write the momentum of " << it.first);
    }

    for (const auto &it : state.adam) {
        const Mat tt = Mat::Constant(1, 1, it.second.t);
        CHK_ERR_RET(write_tensor(ofs, "adam_m/" + it.first, it.second.M),
                    "Failed to write the moments of " << it.first);
        CHK_ERR_RET(write_tensor(ofs, "adam_v/" + it.first, it.second.V),
                    "Failed to write the moments of " << it.first);
        CHK_ERR_RET(write_tensor(ofs, "adam_t/" + it.first, tt),
                    "Failed to write the moments of " << it.first);
    }

    if (session.sampler.has_chain()) {
        CHK_ERR_RET(write_tensor(ofs,
                                 "chain",
                                 session.sampler.persistent_chain()),
                    "Failed to write the persistent chain");
    }

    if (session.tap.has_seeds()) {
        CHK_ERR_RET(write_tensor(ofs, "tap_visible", session.tap.seed_visible()),
                    "Failed to write the TAP seeds");
        CHK_ERR_RET(write_tensor(ofs, "tap_hidden", session.tap.seed_hidden()),
                    "Failed to write the TAP seeds");
    }

    ofs << "rng " << session.rng << "\n";
    return EXIT_SUCCESS;
}

/// model only
inline int
write_checkpoint(const std::string filename, const rbm_t &model)
{
    return write_stream_file(filename, [&](std::ostream &ofs) {
        CHK_ERR_RET(write_model_stream(ofs, model), "Failed checkpoint");
        ofs << "end\n";
        return ofs.good() ? EXIT_SUCCESS : EXIT_FAILURE;
    });
}

/// model and everything needed to resume the session
inline int
write_checkpoint(const std::string filename,
                 const rbm_t &model,
                 const training_session_t &session)
{
    return write_stream_file(filename, [&](std::ostream &ofs) {
        CHK_ERR_RET(write_model_stream(ofs, model), "Failed checkpoint");
        CHK_ERR_RET(write_session_stream(ofs, session),
                    "Failed to write the session");
        ofs << "end\n";
        return ofs.good() ? EXIT_SUCCESS : EXIT_FAILURE;
    });
}

struct layer_header_t {
    layer_header_t()
        : type(BERNOULLI)
        , size(0)
        , learn_var(false)
        , found(false)
    {
    }
    unit_type_t type;
    Index size;
    bool learn_var;
    bool found;
};

inline int
read_tensor(std::istream &ifs, std::string &name, Mat &M)
{
    Index nr, nc;
    ERR_RET(!(ifs >> name >> nr >> nc), "Incomplete tensor header");
    ERR_RET(nr < 0 || nc < 0, "Negative tensor size for " << name);

    M.resize(nr, nc);
    // storage is column-major; the file is row by row
    for (Index r = 0; r < nr; ++r) {
        for (Index c = 0; c < nc; ++c) {
            ERR_RET(!(ifs >> M(r, c)),
                    "Tensor " << name << " ends early at (" << r << ", " << c
                              << ")");
        }
    }
    return EXIT_SUCCESS;
}

inline int
read_layer_header(std::istream &ifs,
                  layer_header_t &visible,
                  layer_header_t &hidden)
{
    std::string role, type;
    Index size;
    int learn;
    ERR_RET(!(ifs >> role >> type >> size >> learn), "Incomplete layer line");
    ERR_RET(type != "bernoulli" && type != "gaussian",
            "Unknown unit type: " << type);
    ERR_RET(size < 1, "Layer size must be positive: " << size);

    layer_header_t *hdr = nullptr;
    if (role == "visible")
        hdr = &visible;
    else if (role == "hidden")
        hdr = &hidden;
    ERR_RET(!hdr, "Unknown layer: " << role);

    hdr->type = parse_unit_type(type);
    hdr->size = size;
    hdr->learn_var = (learn != 0);
    hdr->found = true;
    return EXIT_SUCCESS;
}

inline int
check_tensor_shape(const std::map<std::string, Mat> &tensors,
                   const std::string &name,
                   const Index nr,
                   const Index nc)
{
    auto it = tensors.find(name);
    ERR_RET(it == tensors.end(), "Missing tensor: " << name);
    ERR_RET(it->second.rows() != nr || it->second.cols() != nc,
            "Tensor " << name << " is " << it->second.rows() << " x "
                      << it->second.cols() << ", expected " << nr << " x "
                      << nc);
    return EXIT_SUCCESS;
}

inline int
read_checkpoint_stream(std::istream &ifs, checkpoint_t &out)
{
    std::string key;
    int version = 0;
    ERR_RET(!(ifs >> key >> version) || key != "boltz_checkpoint",
            "Not a checkpoint file");
    ERR_RET(version != CHECKPOINT_VERSION,
            "Unsupported checkpoint version: " << version);

    layer_header_t vis_hdr, hid_hdr;
    std::map<std::string, Mat> tensors;
    bool complete = false;

    while (ifs >> key) {
        if (key == "layer") {
            CHK_ERR_RET(read_layer_header(ifs, vis_hdr, hid_hdr),
                        "Failed to read a layer");
        } else if (key == "step") {
            ERR_RET(!(ifs >> out.step) || out.step < 0, "Bad step count");
        } else if (key == "tensor") {
            std::string name;
            Mat M;
            CHK_ERR_RET(read_tensor(ifs, name, M), "Failed to read a tensor");
            ERR_RET(tensors.count(name) > 0, "Duplicate tensor: " << name);
            tensors[name] = M;
        } else if (key == "rng") {
            std::getline(ifs >> std::ws, out.rng_state);
            ERR_RET(out.rng_state.empty(), "Empty generator state");
        } else if (key == "end") {
            complete = true;
            break;
        } else {
            ELOG("Unknown key: " << key);
            return EXIT_FAILURE;
        }
    }

    ERR_RET(!complete, "Truncated checkpoint");
    ERR_RET(!vis_hdr.found || !hid_hdr.found, "Missing layer description");

    const Index nv = vis_hdr.size, nh = hid_hdr.size;
    CHK_ERR_RET(check_tensor_shape(tensors, "visible_bias", nv, 1),
                "Inconsistent checkpoint");
    CHK_ERR_RET(check_tensor_shape(tensors, "hidden_bias", nh, 1),
                "Inconsistent checkpoint");
    CHK_ERR_RET(check_tensor_shape(tensors, "weight", nv, nh),
                "Inconsistent checkpoint");

    layer_t vis = make_layer(vis_hdr.type, nv, 1.0, vis_hdr.learn_var);
    layer_t hid = make_layer(hid_hdr.type, nh, 1.0, hid_hdr.learn_var);

    layer_bias(vis) = tensors["visible_bias"];
    layer_bias(hid) = tensors["hidden_bias"];

    if (Mat *lv = layer_log_var(vis)) {
        CHK_ERR_RET(check_tensor_shape(tensors, "visible_log_var", nv, 1),
                    "Inconsistent checkpoint");
        *lv = tensors["visible_log_var"];
    }
    if (Mat *lv = layer_log_var(hid)) {
        CHK_ERR_RET(check_tensor_shape(tensors, "hidden_log_var", nh, 1),
                    "Inconsistent checkpoint");
        *lv = tensors["hidden_log_var"];
    }

    out.model = std::make_shared<rbm_t>(vis, hid, tensors["weight"]);

    for (const std::string &name : param_names())
        tensors.erase(name);

    auto chain = tensors.find("chain");
    if (chain != tensors.end()) {
        ERR_RET(chain->second.cols() != nv,
                "Persistent chain has " << chain->second.cols()
                                        << " columns, expected " << nv);
        out.chain = chain->second;
        tensors.erase(chain);
    }

    auto tap_v = tensors.find("tap_visible");
    auto tap_h = tensors.find("tap_hidden");
    ERR_RET((tap_v == tensors.end()) != (tap_h == tensors.end()),
            "TAP seeds need both tap_visible and tap_hidden");
    if (tap_v != tensors.end()) {
        ERR_RET(tap_v->second.cols() != nv || tap_h->second.cols() != nh ||
                    tap_v->second.rows() != tap_h->second.rows(),
                "TAP seeds do not match the layers");
        out.tap_visible = tap_v->second;
        out.tap_hidden = tap_h->second;
        tensors.erase(tap_v);
        tensors.erase(tap_h);
    }

    out.buffers.swap(tensors);
    return EXIT_SUCCESS;
}

inline int
read_checkpoint(const std::string filename, checkpoint_t &out)
{
    out = checkpoint_t();
    return read_stream_file(filename, [&out](std::istream &ifs) {
        return read_checkpoint_stream(ifs, out);
    });
}

////////////////////////////////////////////////////////////////
// Put the saved optimizer buffers, chain, TAP seeds and generator
// back into a session built with the same options
//
// Every buffer must belong to a parameter of `model` and have
// its shape; nothing in the session changes unless all of them
// do.
////////////////////////////////////////////////////////////////

inline void
restore_session(const checkpoint_t &ckpt,
                const rbm_t &model,
                training_session_t &session)
{
    const optimizer_options_t &opt = session.optimizer.options;

    std::map<std::string, std::pair<Index, Index>> shapes;
    const gradient_t like = zero_gradient(model);
    for_each_param(like, [&shapes](const std::string &name, const Mat &g) {
        shapes[name] = std::make_pair(g.rows(), g.cols());
    });

    auto check_name = [&shapes](const std::string &key,
                                const std::string &name) {
        BOLTZ_CHECK_CONFIG(shapes.count(name) > 0,
                           "unknown checkpoint buffer: " << key);
    };

    auto check_buffer = [&shapes, &check_name](const std::string &key,
                                               const std::string &name,
                                               const Mat &M) {
        check_name(key, name);
        auto it = shapes.find(name);
        BOLTZ_CHECK_SHAPE(M.rows() == it->second.first &&
                              M.cols() == it->second.second,
                          "buffer " << key << " is " << M.rows() << " x "
                                    << M.cols() << ", parameter " << name
                                    << " is " << it->second.first << " x "
                                    << it->second.second);
    };

    optimizer_state_t state;
    state.step = ckpt.step;

    for (const auto &it : ckpt.buffers) {
        const std::string &key = it.first;
        const std::size_t pos = key.find('/');
        BOLTZ_CHECK_CONFIG(pos != std::string::npos,
                           "unknown checkpoint buffer: " << key);
        const std::string kind = key.substr(0, pos);
        const std::string name = key.substr(pos + 1);
        const Mat &M = it.second;

        if (kind == "momentum") {
            check_buffer(key, name, M);
            optimizer_state_t::momentum_buffer_t buf(opt.momentum,
                                                     M.rows(),
                                                     M.cols());
            buf.V = M;
            state.momentum.emplace(name, std::move(buf));
        } else if (kind == "adam_m") {
            check_buffer(key, name, M);
            auto v = ckpt.buffers.find("adam_v/" + name);
            auto t = ckpt.buffers.find("adam_t/" + name);
            BOLTZ_CHECK_CONFIG(v != ckpt.buffers.end() &&
                                   t != ckpt.buffers.end(),
                               "incomplete ADAM buffers for " << name);
            check_buffer(v->first, name, v->second);
            BOLTZ_CHECK_SHAPE(t->second.rows() == 1 && t->second.cols() == 1,
                              "buffer " << t->first << " must be 1 x 1");
            BOLTZ_CHECK_CONFIG(t->second(0, 0) >= 0,
                               "negative ADAM step count for " << name);
            optimizer_state_t::adam_buffer_t buf(opt.beta1,
                                                 opt.beta2,
                                                 M.rows(),
                                                 M.cols(),
                                                 opt.epsilon);
            buf.M = M;
            buf.V = v->second;
            buf.t = t->second(0, 0);
            state.adam.emplace(name, std::move(buf));
        } else if (kind == "adam_v" || kind == "adam_t") {
            if (kind == "adam_v")
                check_buffer(key, name, M);
            else
                check_name(key, name);
            BOLTZ_CHECK_CONFIG(ckpt.buffers.count("adam_m/" + name) > 0,
                               "incomplete ADAM buffers for " << name);
        } else {
            throw invalid_configuration_t("unknown checkpoint buffer: " + key);
        }
    }

    BOLTZ_CHECK_SHAPE(ckpt.chain.size() == 0 ||
                          ckpt.chain.cols() == model.num_visible(),
                      "persistent chain has " << ckpt.chain.cols()
                                              << " columns, model has "
                                              << model.num_visible());
    BOLTZ_CHECK_SHAPE(ckpt.tap_visible.size() == 0 ||
                          (ckpt.tap_visible.cols() == model.num_visible() &&
                           ckpt.tap_hidden.cols() == model.num_hidden()),
                      "TAP seeds do not match the model");

    RNG rng = session.rng;
    if (!ckpt.rng_state.empty()) {
        std::istringstream iss(ckpt.rng_state);
        iss >> rng;
        BOLTZ_CHECK_CONFIG(!iss.fail(), "corrupt generator state");
    }

    if (ckpt.tap_visible.size() > 0)
        session.tap.set_seeds(ckpt.tap_visible, ckpt.tap_hidden);
    else
        session.tap.reset();

    session.optimizer.state = std::move(state);

    if (ckpt.chain.size() > 0)
        session.sampler.set_persistent_chain(ckpt.chain);
    else
        session.sampler.reset();

    session.rng = rng;
}

} // namespace boltz

#endif
