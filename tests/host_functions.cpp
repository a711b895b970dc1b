// Host functions resolved by the JIT from the test executable.
#include "jit_helper.hpp"

#include <cstdint>
#include <cstring>
#include <string>

using ccl::test::g_guest_memory;

static std::string guest_string(uint32_t offset){
    uint32_t len = 0;
    std::memcpy(&len, g_guest_memory + offset, sizeof(len));
    return std::string(reinterpret_cast<const char*>(g_guest_memory + offset + 4), len);
}

// Writes into the out buffer after its length header; the guest fills in the header.
static uint32_t guest_write(uint32_t buffer, const std::string& s){
    std::memcpy(g_guest_memory + buffer + 4, s.data(), s.size());
    return static_cast<uint32_t>(s.size());
}

extern "C" {

uint32_t host_get_caller(uint32_t out){
    return guest_write(out, "did:key:alice");
}

int64_t host_get_reputation(uint32_t did){
    return guest_string(did) == "did:key:alice" ? 42 : 0;
}

int64_t host_account_get_mana(uint32_t did){
    return guest_string(did).empty() ? 0 : 1000;
}

int32_t host_account_spend_mana(uint32_t did, int64_t amount){
    return !guest_string(did).empty() && amount >= 0 && amount <= 1000 ? 1 : 0;
}

int32_t host_account_credit_mana(uint32_t did, int64_t amount){
    return !guest_string(did).empty() && amount > 0 ? 1 : 0;
}

int64_t host_get_timestamp(){
    return 1700000000;
}

uint32_t host_dag_put(uint32_t content, uint32_t out){
    return guest_write(out, "cid:" + guest_string(content));
}

// Answers with a payload longer than any reasonable buffer for the "huge" key.
uint32_t host_dag_get(uint32_t cid, uint32_t out){
    const std::string key = guest_string(cid);
    if(key == "huge") return 100000;
    return guest_write(out, "data:" + key);
}

int32_t host_anchor_receipt(uint32_t receipt){
    return guest_string(receipt).empty() ? 0 : 1;
}

int32_t host_submit_mesh_job(uint32_t spec, int64_t mana){
    return !guest_string(spec).empty() && mana > 0 ? 1 : 0;
}

// Weight recorded since the last host_recorded_weight() call.
static int64_t g_recorded_weight = 0;

void host_record_vote(uint32_t did, int64_t weight){
    if(!guest_string(did).empty()) g_recorded_weight += weight;
}

int64_t host_recorded_weight(){
    const int64_t total = g_recorded_weight;
    g_recorded_weight = 0;
    return total;
}

int32_t host_is_member(uint32_t did){
    return guest_string(did).rfind("did:key:", 0) == 0 ? 1 : 0;
}

uint32_t host_lookup_name(uint32_t did, uint32_t out){
    return guest_write(out, guest_string(did) == "did:key:alice" ? "Alice" : "unknown");
}

} // extern "C"
